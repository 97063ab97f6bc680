// SPDX-License-Identifier: Apache-2.0
#include "ToolBridge.hpp"

#include <core/JsonUtils.hpp>
#include <mcp/HealthClassifier.hpp>
#include <mcp/ServerManager.hpp>

#include <algorithm>
#include <format>

namespace mcpdesk
{

namespace asio = boost::asio;

auto qualifyToolName(std::string_view serverId, std::string_view toolName) -> std::string
{
    return std::format("{}{}{}", serverId, QualifiedNameSeparator, toolName);
}

auto splitQualifiedName(std::string_view qualifiedName) -> std::optional<std::pair<std::string, std::string>>
{
    auto const pos = qualifiedName.find(QualifiedNameSeparator);
    if (pos == std::string_view::npos || pos == 0 || pos + 1 == qualifiedName.size())
        return std::nullopt;

    return std::pair { std::string(qualifiedName.substr(0, pos)), std::string(qualifiedName.substr(pos + 1)) };
}

auto normalizeToolResult(const nlohmann::json& raw) -> ToolResult
{
    auto result = ToolResult { .raw = raw, .isError = raw.is_object() && json::getBoolOr(raw, "isError", false) };

    auto const content = raw.is_object() ? raw.find("content") : raw.end();
    if (raw.is_object() && content != raw.end() && content->is_array())
    {
        auto textParts = 0;
        for (const auto& part: *content)
        {
            if (!part.is_object() || json::getStringOr(part, "type", "") != "text")
                continue;
            if (textParts++ > 0)
                result.content += '\n';
            result.content += json::getStringOr(part, "text", "");
        }
        if (textParts > 0)
            return result;
    }

    result.content = raw.dump();
    return result;
}

ToolBridge::ToolBridge(ServerManager& servers): _servers(servers)
{
}

auto ToolBridge::activeToolsFor(const EnabledTools& enabled) -> asio::awaitable<std::vector<BridgedTool>>
{
    auto bridged = std::vector<BridgedTool> {};

    for (const auto& [serverId, toolNames]: enabled)
    {
        if (toolNames.empty())
            continue;

        auto const status = _servers.status(serverId);
        if (!status || status->state != ServerState::Running)
        {
            _logger.debug("Skipping tools of '{}': server is not running", serverId);
            continue;
        }

        auto tools = co_await _servers.refreshTools(serverId);
        if (!tools)
        {
            _logger.warning("Failed to list tools for '{}': {}", serverId, tools.error().message);
            if (isConnectionLevel(tools.error()))
                _servers.evict(serverId, ServerState::Error, tools.error().message);
            continue;
        }

        for (const auto& name: toolNames)
        {
            auto const tool = std::ranges::find(*tools, name, &ToolDefinition::name);
            if (tool == tools->end())
            {
                _logger.debug("Tool '{}' is no longer offered by '{}'", name, serverId);
                continue;
            }

            bridged.push_back(BridgedTool {
                .qualifiedName = qualifyToolName(serverId, tool->name),
                .serverId = serverId,
                .toolName = tool->name,
                .description = tool->description,
                .parameters = tool->inputSchema,
            });
        }
    }

    co_return bridged;
}

auto ToolBridge::invoke(std::string qualifiedName, nlohmann::json arguments, std::stop_token stop)
    -> asio::awaitable<Result<ToolResult>>
{
    auto const parts = splitQualifiedName(qualifiedName);
    if (!parts)
        co_return makeError(ErrorCode::InvalidArgument, std::format("Invalid tool name '{}'", qualifiedName));

    auto const& [serverId, toolName] = *parts;
    if (!_servers.isRunning(serverId))
    {
        auto const status = _servers.status(serverId);
        if (status && status->error)
            co_return makeError(ErrorCode::ConnectionLost,
                                std::format("Server '{}' is no longer available: {}", serverId, *status->error));
        co_return makeError(ErrorCode::ConnectionLost, std::format("No active connection for server '{}'", serverId));
    }

    _logger.debug("Calling '{}' on '{}'", toolName, serverId);
    auto raw = co_await _servers.callTool(serverId, toolName, std::move(arguments), std::move(stop));
    if (!raw)
    {
        auto const kind = classifyFailure(raw.error());
        _logger.warning("Tool '{}' failed ({}): {}", qualifiedName, failureKindName(kind), raw.error().message);
        if (kind == FailureKind::ConnectionLevel)
            _servers.evict(serverId, ServerState::Error, raw.error().message);
        co_return std::unexpected(raw.error());
    }

    co_return normalizeToolResult(*raw);
}

auto makeCallableTools(ToolBridge& bridge, const std::vector<BridgedTool>& tools) -> std::vector<CallableTool>
{
    auto callables = std::vector<CallableTool> {};
    callables.reserve(tools.size());
    for (const auto& tool: tools)
    {
        callables.push_back(CallableTool {
            .definition = tool.definition(),
            .execute = [&bridge, name = tool.qualifiedName](nlohmann::json arguments, std::stop_token stop) {
                return bridge.invoke(name, std::move(arguments), std::move(stop));
            },
        });
    }
    return callables;
}

} // namespace mcpdesk
