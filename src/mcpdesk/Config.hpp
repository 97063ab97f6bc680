// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentLoop.hpp>
#include <core/Error.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/TransportNegotiator.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace mcpdesk
{

/// @brief Agent loop configuration section.
struct AgentSettings
{
    int maxToolSteps = 10;
    std::string systemPrompt = "You are a helpful assistant with access to tools.";

    [[nodiscard]] auto loopConfig() const -> AgentConfig;
};

/// @brief Timing configuration section, all values in milliseconds in the file.
struct TimeoutSettings
{
    std::chrono::milliseconds request { 10'000 };
    std::chrono::milliseconds handshake { 10'000 };
    std::chrono::milliseconds simulatedReplyDelay { 100 };
    std::chrono::milliseconds pollInterval { 500 };
    std::chrono::milliseconds pollExpiry { 30'000 };

    [[nodiscard]] auto connectOptions() const -> ConnectOptions;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ServerConfigMap mcpServers;
    AgentSettings agent;
    TimeoutSettings timeouts;
    std::string logLevel = "info";
};

/// @brief Builds the configuration from a parsed config document.
///
/// `mcpServers` may be an object or a string holding the JSON of that object.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcpdesk
