// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentLoop.hpp>
#include <core/Error.hpp>
#include <mcpdesk/Config.hpp>

#include <memory>
#include <string>

namespace mcpdesk
{

/// @brief Command-line front end: owns the event loop, the server registry and the tool bridge.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    /// @param configPath File re-read on SIGHUP while serving; empty means the default path.
    App(AppConfig config, std::string configPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Starts all enabled servers, prints their status and shuts down.
    [[nodiscard]] auto status() -> int;

    /// @brief Prints the tools a running server offers.
    [[nodiscard]] auto listTools(const std::string& serverId) -> int;

    /// @brief Calls one tool by qualified name and prints its output.
    /// @param argumentsJson JSON object with the tool arguments.
    [[nodiscard]] auto callTool(const std::string& qualifiedName, const std::string& argumentsJson) -> int;

    /// @brief Keeps the servers running until SIGINT or SIGTERM; SIGHUP reloads the configuration.
    [[nodiscard]] auto serve() -> int;

    /// @brief Answers one message with @p model, offering every tool of every running server.
    ///
    /// The first call starts the servers; they keep running until the App is destroyed.
    /// The conversation opens with the configured system prompt and carries over between calls.
    [[nodiscard]] auto ask(ChatModel& model, std::string message) -> Result<TurnOutcome>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpdesk
