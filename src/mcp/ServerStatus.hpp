// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Lifecycle state of a configured server.
enum class ServerState
{
    Unloaded,
    Starting,
    Running,
    Error,
    Stopped,
};

[[nodiscard]] constexpr auto serverStateName(ServerState state) -> std::string_view
{
    switch (state)
    {
        case ServerState::Unloaded: return "unloaded";
        case ServerState::Starting: return "starting";
        case ServerState::Running: return "running";
        case ServerState::Error: return "error";
        case ServerState::Stopped: return "stopped";
    }
    return "unloaded";
}

/// @brief A tool as advertised by a server.
struct ToolInfo
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    bool enabled = false;
};

/// @brief What the UI shows for one configured server.
struct ServerStatus
{
    std::string id;
    std::string name;
    std::string description;
    ServerState state = ServerState::Unloaded;
    std::vector<ToolInfo> tools;
    std::optional<std::string> error;
    std::optional<TransportProtocol> protocol;

    [[nodiscard]] auto hasTool(std::string_view toolName) const -> bool
    {
        for (const auto& tool: tools)
        {
            if (tool.name == toolName)
                return true;
        }
        return false;
    }
};

} // namespace mcpdesk
