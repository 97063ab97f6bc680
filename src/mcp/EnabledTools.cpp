// SPDX-License-Identifier: Apache-2.0
#include "EnabledTools.hpp"

#include <algorithm>
#include <format>

namespace mcpdesk
{

auto isToolEnabled(const EnabledTools& enabled, std::string_view serverId, std::string_view toolName) -> bool
{
    auto const it = enabled.find(serverId);
    if (it == enabled.end())
        return false;
    return std::ranges::find(it->second, toolName) != it->second.end();
}

auto toggleTool(EnabledTools& enabled, std::string_view serverId, std::string_view toolName) -> bool
{
    auto it = enabled.find(serverId);
    if (it == enabled.end())
        it = enabled.emplace(std::string(serverId), std::vector<std::string> {}).first;

    auto& tools = it->second;
    if (auto const pos = std::ranges::find(tools, toolName); pos != tools.end())
    {
        tools.erase(pos);
        if (tools.empty())
            enabled.erase(it);
        return false;
    }

    tools.emplace_back(toolName);
    return true;
}

void enableAllTools(EnabledTools& enabled, const ServerStatus& server)
{
    if (server.tools.empty())
        return;

    auto names = std::vector<std::string> {};
    names.reserve(server.tools.size());
    for (const auto& tool: server.tools)
        names.push_back(tool.name);
    enabled.insert_or_assign(server.id, std::move(names));
}

void disableAllTools(EnabledTools& enabled, std::string_view serverId)
{
    if (auto const it = enabled.find(serverId); it != enabled.end())
        enabled.erase(it);
}

void enableAllRunningTools(EnabledTools& enabled, const std::vector<ServerStatus>& servers)
{
    for (const auto& server: servers)
    {
        if (server.state == ServerState::Running)
            enableAllTools(enabled, server);
    }
}

auto enabledToolCount(const EnabledTools& enabled) -> std::size_t
{
    auto count = std::size_t { 0 };
    for (const auto& [serverId, tools]: enabled)
        count += tools.size();
    return count;
}

auto enabledToolsFromJson(const nlohmann::json& value) -> Result<EnabledTools>
{
    auto enabled = EnabledTools {};
    if (value.is_null())
        return enabled;
    if (!value.is_object())
        return makeError(ErrorCode::InvalidArgument, "Enabled tools must be an object");

    for (const auto& [serverId, tools]: value.items())
    {
        if (!tools.is_array())
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Enabled tools for '{}' must be an array of names", serverId));

        auto names = std::vector<std::string> {};
        for (const auto& tool: tools)
        {
            if (tool.is_string())
                names.push_back(tool.get<std::string>());
        }
        if (!names.empty())
            enabled.emplace(serverId, std::move(names));
    }
    return enabled;
}

auto toJson(const EnabledTools& enabled) -> nlohmann::json
{
    auto result = nlohmann::json::object();
    for (const auto& [serverId, tools]: enabled)
        result[serverId] = tools;
    return result;
}

} // namespace mcpdesk
