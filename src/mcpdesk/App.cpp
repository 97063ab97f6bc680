// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/ChatSession.hpp>
#include <core/Async.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/EnabledTools.hpp>
#include <mcp/ServerManager.hpp>
#include <mcp/ToolBridge.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <format>
#include <optional>
#include <print>

namespace mcpdesk
{

namespace
{
    auto describeStatus(const ServerStatus& status) -> std::string
    {
        auto line = std::format("{:<20} {:<9}", status.id, serverStateName(status.state));
        if (status.protocol)
            line += std::format(" via {}", protocolName(*status.protocol));
        if (status.state == ServerState::Running)
            line += std::format(", {} tool(s)", status.tools.size());
        if (status.error)
            line += std::format(": {}", *status.error);
        return line;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::string configPath;
    asio::io_context io;
    ServerManager servers;
    ToolBridge bridge;
    ChatSession conversation;
    bool conversing = false;
    int exitCode = 0;

    Impl(AppConfig cfg, std::string path):
        config(std::move(cfg)),
        configPath(std::move(path)),
        servers(io.get_executor(), config.timeouts.connectOptions()),
        bridge(servers),
        conversation(config.agent.systemPrompt)
    {
        servers.setWarningHandler([](const std::string& message) { std::println(stderr, "warning: {}", message); });
    }

    ~Impl()
    {
        if (conversing)
            run(servers.shutdownAll());
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    /// @brief Runs @p task to completion on the event loop.
    void run(asio::awaitable<void> task)
    {
        asio::co_spawn(io, std::move(task), [this](std::exception_ptr failure) {
            if (!failure)
                return;
            try
            {
                std::rethrow_exception(failure);
            }
            catch (const std::exception& e)
            {
                log::error("Unhandled failure: {}", e.what());
                exitCode = 1;
            }
        });
        io.run();
        io.restart();
    }

    auto printStatus() -> asio::awaitable<void>
    {
        co_await servers.initialize(config.mcpServers);

        auto const statuses = servers.statuses();
        if (statuses.empty())
            std::println("No MCP servers configured.");
        for (const auto& status: statuses)
            std::println("{}", describeStatus(status));

        co_await servers.shutdownAll();
    }

    auto printTools(std::string serverId) -> asio::awaitable<void>
    {
        co_await servers.initialize(config.mcpServers);

        auto tools = co_await servers.refreshTools(serverId);
        if (!tools)
        {
            std::println(stderr, "Cannot list tools of '{}': {}", serverId, tools.error().message);
            exitCode = 1;
        }
        else
        {
            for (const auto& tool: *tools)
            {
                std::println("{}", qualifyToolName(serverId, tool.name));
                if (!tool.description.empty())
                    std::println("    {}", tool.description);
            }
        }

        co_await servers.shutdownAll();
    }

    auto invokeTool(std::string qualifiedName, nlohmann::json arguments) -> asio::awaitable<void>
    {
        co_await servers.initialize(config.mcpServers);

        auto result = co_await bridge.invoke(qualifiedName, std::move(arguments));
        if (!result)
        {
            std::println(stderr, "Tool call failed: {}", result.error().message);
            exitCode = 1;
        }
        else
        {
            std::println("{}", result->content);
            if (result->isError)
                exitCode = 1;
        }

        co_await servers.shutdownAll();
    }

    auto serveUntilSignalled() -> asio::awaitable<void>
    {
        servers.setStatusListener([](const std::vector<ServerStatus>& statuses) {
            for (const auto& status: statuses)
                log::debug("{}", describeStatus(status));
        });

        // Armed before the servers start; a signal during startup stays queued.
        auto signals = asio::signal_set(io, SIGHUP, SIGINT, SIGTERM);

        co_await servers.initialize(config.mcpServers);
        for (const auto& status: servers.statuses())
            log::info("{}", describeStatus(status));

        for (;;)
        {
            auto ec = boost::system::error_code {};
            auto const signal = co_await signals.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                break;

            if (signal != SIGHUP)
            {
                log::info("Received signal {}, shutting down", signal);
                break;
            }

            log::info("Reloading configuration from {}", configPath);
            auto reloaded = loadConfigFromFile(configPath);
            if (!reloaded)
            {
                log::error("Failed to reload config, keeping current servers: {}", reloaded.error().message);
                continue;
            }

            config = std::move(*reloaded);
            auto const plan = co_await servers.reconcile(config.mcpServers);
            if (plan.empty())
                log::info("MCP servers unchanged");
        }

        co_await servers.shutdownAll();
    }

    auto answer(ChatModel& model, std::string message, std::optional<Result<TurnOutcome>>& outcome)
        -> asio::awaitable<void>
    {
        if (!conversing)
        {
            co_await servers.initialize(config.mcpServers);
            conversing = true;
        }

        auto enabled = EnabledTools {};
        enableAllRunningTools(enabled, servers.statuses());
        auto const tools = co_await bridge.activeToolsFor(enabled);
        log::debug("Offering {} tool(s) to the model", tools.size());

        auto loop = AgentLoop(model, conversation, makeCallableTools(bridge, tools), config.agent.loopConfig());
        outcome = co_await loop.runTurn(std::move(message));
    }
};

App::App(AppConfig config, std::string configPath):
    _impl(std::make_unique<Impl>(std::move(config), configPath.empty() ? defaultConfigPath() : std::move(configPath)))
{
}

App::~App() = default;

auto App::status() -> int
{
    _impl->run(_impl->printStatus());
    return _impl->exitCode;
}

auto App::listTools(const std::string& serverId) -> int
{
    _impl->run(_impl->printTools(serverId));
    return _impl->exitCode;
}

auto App::callTool(const std::string& qualifiedName, const std::string& argumentsJson) -> int
{
    auto arguments = json::parse(argumentsJson.empty() ? std::string_view { "{}" } : std::string_view { argumentsJson },
                                 ErrorCode::InvalidArgument);
    if (!arguments || !arguments->is_object())
    {
        std::println(stderr, "Tool arguments must be a JSON object");
        return 2;
    }

    _impl->run(_impl->invokeTool(qualifiedName, std::move(*arguments)));
    return _impl->exitCode;
}

auto App::serve() -> int
{
    _impl->run(_impl->serveUntilSignalled());
    return _impl->exitCode;
}

auto App::ask(ChatModel& model, std::string message) -> Result<TurnOutcome>
{
    auto outcome = std::optional<Result<TurnOutcome>> {};
    _impl->run(_impl->answer(model, std::move(message), outcome));
    if (!outcome)
        return makeError(ErrorCode::ModelError, "Turn ended without an outcome");
    return std::move(*outcome);
}

} // namespace mcpdesk
