// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpdesk
{

namespace
{
    auto millisecondsOr(const nlohmann::json& section, std::string_view key, std::chrono::milliseconds fallback)
        -> std::chrono::milliseconds
    {
        auto const value = json::getIntOr(section, key, static_cast<int>(fallback.count()));
        return value > 0 ? std::chrono::milliseconds(value) : fallback;
    }
} // namespace

auto AgentSettings::loopConfig() const -> AgentConfig
{
    return AgentConfig { .maxToolSteps = std::max(0, maxToolSteps) };
}

auto TimeoutSettings::connectOptions() const -> ConnectOptions
{
    return ConnectOptions {
        .requestTimeout = request,
        .handshakeTimeout = handshake,
        .simulatedReplyDelay = simulatedReplyDelay,
        .pollInterval = pollInterval,
        .pollExpiry = pollExpiry,
    };
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\mcpdesk";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcpdesk";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcpdesk";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpdesk";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be an object");

    auto config = AppConfig {};

    // MCP servers section; the settings store may hand it over as a string.
    if (auto const servers = root.find("mcpServers"); servers != root.end() && !servers->is_null())
    {
        auto parsed = servers->is_string() ? parseServerConfigs(servers->get<std::string>())
                                           : parseServerConfigJson(*servers);
        if (!parsed)
            return std::unexpected(parsed.error());
        config.mcpServers = std::move(*parsed);
    }

    // Agent section
    if (root.contains("agent"))
    {
        auto const& agent = root["agent"];
        config.agent.maxToolSteps = json::getIntOr(agent, "maxToolSteps", 10);
        config.agent.systemPrompt = json::getStringOr(agent, "systemPrompt", config.agent.systemPrompt);
    }

    // Timeouts section
    if (root.contains("timeouts"))
    {
        auto const& timeouts = root["timeouts"];
        auto& t = config.timeouts;
        t.request = millisecondsOr(timeouts, "requestMs", t.request);
        t.handshake = millisecondsOr(timeouts, "handshakeMs", t.handshake);
        t.simulatedReplyDelay = millisecondsOr(timeouts, "simulatedReplyDelayMs", t.simulatedReplyDelay);
        t.pollInterval = millisecondsOr(timeouts, "pollIntervalMs", t.pollInterval);
        t.pollExpiry = millisecondsOr(timeouts, "pollExpiryMs", t.pollExpiry);
    }

    config.logLevel = json::getStringOr(root, "logLevel", config.logLevel);
    if (!log::levelFromString(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", config.logLevel));

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content, ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    return parseConfig(*parseResult);
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["mcpServers"] = toJson(config.mcpServers);

    // Agent section
    auto agent = nlohmann::json::object();
    agent["maxToolSteps"] = config.agent.maxToolSteps;
    agent["systemPrompt"] = config.agent.systemPrompt;
    root["agent"] = std::move(agent);

    // Timeouts section
    auto timeouts = nlohmann::json::object();
    timeouts["requestMs"] = config.timeouts.request.count();
    timeouts["handshakeMs"] = config.timeouts.handshake.count();
    timeouts["simulatedReplyDelayMs"] = config.timeouts.simulatedReplyDelay.count();
    timeouts["pollIntervalMs"] = config.timeouts.pollInterval.count();
    timeouts["pollExpiryMs"] = config.timeouts.pollExpiry.count();
    root["timeouts"] = std::move(timeouts);

    root["logLevel"] = config.logLevel;

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcpdesk
