// SPDX-License-Identifier: Apache-2.0
#include "ServerConfig.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace mcpdesk
{

namespace
{
    auto shapeError(std::string_view id, std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigError, std::format("Server '{}': {}", id, what));
    }

    auto parseKind(std::string_view id, const nlohmann::json& entry) -> TransportKind
    {
        auto const it = entry.find("transport");
        if (it == entry.end() || !it->is_string())
            return TransportKind::Stdio;

        auto const& name = it->get_ref<const std::string&>();
        if (name == "http")
            return TransportKind::Http;
        if (name == "websocket")
            return TransportKind::WebSocket;
        if (name != "stdio")
            log::warning("Server '{}': unknown transport '{}', using stdio", id, name);
        return TransportKind::Stdio;
    }

    /// Reads an optional object of strings; a present value of the wrong shape is an error.
    auto readStringMap(std::string_view id, const nlohmann::json& entry, std::string_view key)
        -> Result<std::map<std::string, std::string>>
    {
        auto const it = entry.find(std::string(key));
        if (it == entry.end() || it->is_null())
            return std::map<std::string, std::string> {};
        if (!it->is_object())
            return shapeError(id, std::format("'{}' must be an object of strings", key));

        auto values = std::map<std::string, std::string> {};
        for (const auto& [name, value]: it->items())
        {
            if (!value.is_string())
                return shapeError(id, std::format("'{}.{}' must be a string", key, name));
            values[name] = value.get<std::string>();
        }
        return values;
    }

    auto requireString(std::string_view id, const nlohmann::json& entry, std::string_view key, std::string_view kind)
        -> Result<std::string>
    {
        auto const it = entry.find(std::string(key));
        if (it == entry.end() || !it->is_string() || it->get_ref<const std::string&>().empty())
            return shapeError(id, std::format("transport '{}' requires a non-empty '{}'", kind, key));
        return it->get<std::string>();
    }

    auto parseStdio(std::string_view id, const nlohmann::json& entry) -> Result<StdioServerConfig>
    {
        auto command = requireString(id, entry, "command", "stdio");
        if (!command)
            return std::unexpected(command.error());

        auto config = StdioServerConfig { .command = std::move(*command) };

        if (auto const args = entry.find("args"); args != entry.end() && !args->is_null())
        {
            if (!args->is_array())
                return shapeError(id, "'args' must be an array of strings");
            for (const auto& arg: *args)
            {
                if (!arg.is_string())
                    return shapeError(id, "'args' must be an array of strings");
                config.args.push_back(arg.get<std::string>());
            }
        }

        auto env = readStringMap(id, entry, "env");
        if (!env)
            return std::unexpected(env.error());
        config.env = std::move(*env);

        if (auto const cwd = entry.find("cwd"); cwd != entry.end() && cwd->is_string() && !cwd->empty())
            config.cwd = cwd->get<std::string>();

        return config;
    }

    auto parseHttp(std::string_view id, const nlohmann::json& entry) -> Result<HttpServerConfig>
    {
        auto url = requireString(id, entry, "url", "http");
        if (!url)
            return std::unexpected(url.error());
        auto headers = readStringMap(id, entry, "headers");
        if (!headers)
            return std::unexpected(headers.error());
        return HttpServerConfig { .url = std::move(*url), .headers = std::move(*headers) };
    }

    auto parseWebSocket(std::string_view id, const nlohmann::json& entry) -> Result<WebSocketServerConfig>
    {
        auto url = requireString(id, entry, "url", "websocket");
        if (!url)
            return std::unexpected(url.error());
        auto headers = readStringMap(id, entry, "headers");
        if (!headers)
            return std::unexpected(headers.error());

        auto config = WebSocketServerConfig { .url = std::move(*url), .headers = std::move(*headers) };
        config.reconnectAttempts = std::max(0, json::getIntOr(entry, "reconnectAttempts", 5));
        config.reconnectDelay = std::chrono::milliseconds { std::max(0, json::getIntOr(entry, "reconnectDelay", 1000)) };
        return config;
    }

    auto headersToJson(const HttpHeaders& headers) -> nlohmann::json
    {
        auto object = nlohmann::json::object();
        for (const auto& [name, value]: headers)
            object[name] = value;
        return object;
    }
} // namespace

auto parseServerConfig(std::string_view id, const nlohmann::json& entry) -> Result<ServerConfig>
{
    if (!entry.is_object())
        return shapeError(id, "configuration must be an object");

    auto config = ServerConfig {
        .name = json::getStringOr(entry, "name", id),
        .description = json::getStringOr(entry, "description", ""),
        .enabled = json::getBoolOr(entry, "enabled", true),
        .transport = StdioServerConfig {},
    };

    switch (parseKind(id, entry))
    {
        case TransportKind::Stdio: {
            auto stdio = parseStdio(id, entry);
            if (!stdio)
                return std::unexpected(stdio.error());
            config.transport = std::move(*stdio);
            break;
        }
        case TransportKind::Http: {
            auto http = parseHttp(id, entry);
            if (!http)
                return std::unexpected(http.error());
            config.transport = std::move(*http);
            break;
        }
        case TransportKind::WebSocket: {
            auto ws = parseWebSocket(id, entry);
            if (!ws)
                return std::unexpected(ws.error());
            config.transport = std::move(*ws);
            break;
        }
    }

    return config;
}

auto parseServerConfigJson(const nlohmann::json& root) -> Result<ServerConfigMap>
{
    if (root.is_null())
        return ServerConfigMap {};
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "MCP server configuration must be a JSON object");

    auto configs = ServerConfigMap {};
    for (const auto& [id, entry]: root.items())
    {
        if (id.empty())
            return makeError(ErrorCode::ConfigError, "MCP server id must not be empty");
        // Tool names are qualified as "<id>_<tool>" and split at the first '_'.
        if (id.find('_') != std::string::npos)
            return makeError(ErrorCode::ConfigError, std::format("MCP server id '{}' must not contain '_'", id));

        auto config = parseServerConfig(id, entry);
        if (!config)
            return std::unexpected(config.error());
        configs.emplace(id, std::move(*config));
    }
    return configs;
}

auto parseServerConfigs(std::string_view text) -> Result<ServerConfigMap>
{
    if (text.find_first_not_of(" \t\r\n") == std::string_view::npos)
        return ServerConfigMap {};

    auto root = json::parse(text, ErrorCode::ConfigError);
    if (!root)
        return std::unexpected(root.error());
    return parseServerConfigJson(*root);
}

auto toJson(const ServerConfig& config) -> nlohmann::json
{
    auto entry = nlohmann::json {
        { "name", config.name },
        { "transport", transportKindName(config.kind()) },
        { "enabled", config.enabled },
    };
    if (!config.description.empty())
        entry["description"] = config.description;

    if (auto const* stdio = std::get_if<StdioServerConfig>(&config.transport))
    {
        entry["command"] = stdio->command;
        if (!stdio->args.empty())
            entry["args"] = stdio->args;
        if (!stdio->env.empty())
            entry["env"] = headersToJson(stdio->env);
        if (stdio->cwd)
            entry["cwd"] = *stdio->cwd;
    }
    else if (auto const* http = std::get_if<HttpServerConfig>(&config.transport))
    {
        entry["url"] = http->url;
        if (!http->headers.empty())
            entry["headers"] = headersToJson(http->headers);
    }
    else if (auto const* ws = std::get_if<WebSocketServerConfig>(&config.transport))
    {
        entry["url"] = ws->url;
        if (!ws->headers.empty())
            entry["headers"] = headersToJson(ws->headers);
        entry["reconnectAttempts"] = ws->reconnectAttempts;
        entry["reconnectDelay"] = ws->reconnectDelay.count();
    }

    return entry;
}

auto toJson(const ServerConfigMap& configs) -> nlohmann::json
{
    auto root = nlohmann::json::object();
    for (const auto& [id, config]: configs)
        root[id] = toJson(config);
    return root;
}

} // namespace mcpdesk
