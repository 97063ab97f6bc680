// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerStatus.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Tools a conversation has switched on, as server id to tool names.
///
/// Owned by the conversation; the bridge only reads it.
using EnabledTools = std::map<std::string, std::vector<std::string>, std::less<>>;

[[nodiscard]] auto isToolEnabled(const EnabledTools& enabled, std::string_view serverId, std::string_view toolName)
    -> bool;

/// @brief Flips one tool on or off.
/// @return The new state of the tool.
auto toggleTool(EnabledTools& enabled, std::string_view serverId, std::string_view toolName) -> bool;

/// @brief Enables every tool the server currently advertises.
void enableAllTools(EnabledTools& enabled, const ServerStatus& server);

void disableAllTools(EnabledTools& enabled, std::string_view serverId);

/// @brief Enables every tool of every running server.
void enableAllRunningTools(EnabledTools& enabled, const std::vector<ServerStatus>& servers);

/// @brief Number of enabled tool names across all servers.
[[nodiscard]] auto enabledToolCount(const EnabledTools& enabled) -> std::size_t;

[[nodiscard]] auto enabledToolsFromJson(const nlohmann::json& value) -> Result<EnabledTools>;
[[nodiscard]] auto toJson(const EnabledTools& enabled) -> nlohmann::json;

} // namespace mcpdesk
