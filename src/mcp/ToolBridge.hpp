// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <mcp/EnabledTools.hpp>

#include <boost/asio/awaitable.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpdesk
{

class ServerManager;

/// @brief Separates the server id from the tool name in a qualified tool name.
///
/// Server ids must not contain it, as the first occurrence marks the split.
constexpr char QualifiedNameSeparator = '_';

/// @brief A server tool exposed to the model under a name unique across servers.
struct BridgedTool
{
    std::string qualifiedName;
    std::string serverId;
    std::string toolName;
    std::string description;
    nlohmann::json parameters;

    [[nodiscard]] auto definition() const -> ToolDefinition
    {
        return ToolDefinition { .name = qualifiedName, .description = description, .inputSchema = parameters };
    }
};

[[nodiscard]] auto qualifyToolName(std::string_view serverId, std::string_view toolName) -> std::string;

/// @brief Splits a qualified name at its first separator into (server id, tool name).
/// @return std::nullopt if there is no separator or either part is empty.
[[nodiscard]] auto splitQualifiedName(std::string_view qualifiedName)
    -> std::optional<std::pair<std::string, std::string>>;

/// @brief Flattens a `tools/call` result into the text handed back to the model.
///
/// Text parts of a `content` array are joined with newlines. A result without
/// text parts is passed on as its JSON serialization.
[[nodiscard]] auto normalizeToolResult(const nlohmann::json& raw) -> ToolResult;

/// @brief Connects the tools of running servers to the model's tool-calling loop.
class ToolBridge
{
  public:
    explicit ToolBridge(ServerManager& servers);

    /// @brief Resolves the tools a conversation has enabled against the running servers.
    ///
    /// Tool lists are fetched live, so schemas are current. Servers that are not
    /// running and tools that a server no longer advertises are skipped.
    [[nodiscard]] auto activeToolsFor(const EnabledTools& enabled) -> boost::asio::awaitable<std::vector<BridgedTool>>;

    /// @brief Calls a tool by its qualified name.
    ///
    /// A connection-level failure evicts the server, so later calls fail fast.
    /// A result flagged `isError` by the server is returned as a ToolResult with
    /// isError set, not as an Error.
    [[nodiscard]] auto invoke(std::string qualifiedName, nlohmann::json arguments, std::stop_token stop = {})
        -> boost::asio::awaitable<Result<ToolResult>>;

  private:
    ServerManager& _servers;
    log::Logger _logger { "bridge" };
};

/// @brief A tool as the model layer sees it: a definition plus an async execute function.
struct CallableTool
{
    using Execute = std::function<boost::asio::awaitable<Result<ToolResult>>(nlohmann::json arguments, std::stop_token stop)>;

    ToolDefinition definition;
    Execute execute;
};

/// @brief Wraps bridged tools so that executing one invokes it through @p bridge.
///
/// @p bridge must outlive the returned tools.
[[nodiscard]] auto makeCallableTools(ToolBridge& bridge, const std::vector<BridgedTool>& tools)
    -> std::vector<CallableTool>;

} // namespace mcpdesk
