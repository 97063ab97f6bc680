// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/HttpClient.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcpdesk
{

/// @brief The `transport` discriminant of a server configuration.
enum class TransportKind
{
    Stdio,
    Http,
    WebSocket,
};

[[nodiscard]] constexpr auto transportKindName(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
        case TransportKind::WebSocket: return "websocket";
    }
    return "stdio";
}

struct StdioServerConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;
};

struct HttpServerConfig
{
    std::string url;
    HttpHeaders headers;
};

struct WebSocketServerConfig
{
    std::string url;
    HttpHeaders headers;
    int reconnectAttempts = 5;
    std::chrono::milliseconds reconnectDelay { 1000 };
};

using TransportConfig = std::variant<StdioServerConfig, HttpServerConfig, WebSocketServerConfig>;

/// @brief Configuration of one MCP server, keyed by server id in a ServerConfigMap.
struct ServerConfig
{
    std::string name;
    std::string description;
    bool enabled = true;
    TransportConfig transport;

    [[nodiscard]] auto kind() const -> TransportKind { return static_cast<TransportKind>(transport.index()); }
};

using ServerConfigMap = std::map<std::string, ServerConfig>;

/// @brief Parses one server entry. A missing or unrecognized `transport` means stdio.
/// @param id The server id, used as the default name and in error messages.
/// @param entry The JSON object for this server.
[[nodiscard]] auto parseServerConfig(std::string_view id, const nlohmann::json& entry) -> Result<ServerConfig>;

/// @brief Parses an object mapping server id to server configuration.
[[nodiscard]] auto parseServerConfigJson(const nlohmann::json& root) -> Result<ServerConfigMap>;

/// @brief Parses a configuration string as stored by the settings layer.
///
/// An empty or whitespace-only string is an empty configuration.
[[nodiscard]] auto parseServerConfigs(std::string_view text) -> Result<ServerConfigMap>;

/// @brief Serializes a server configuration back to its JSON form.
[[nodiscard]] auto toJson(const ServerConfig& config) -> nlohmann::json;

[[nodiscard]] auto toJson(const ServerConfigMap& configs) -> nlohmann::json;

} // namespace mcpdesk
