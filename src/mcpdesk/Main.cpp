// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcpdesk/App.hpp>
#include <mcpdesk/Config.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcpdesk: connects to MCP tool servers over stdio, HTTP and WebSocket" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* statusCmd = app.add_subcommand("status", "Start the configured servers and report their status");

    auto serverId = std::string {};
    auto* toolsCmd = app.add_subcommand("tools", "List the tools a server offers");
    toolsCmd->add_option("server", serverId, "Server id")->required();

    auto toolName = std::string {};
    auto toolArgs = std::string {};
    auto* callCmd = app.add_subcommand("call", "Call a tool by its qualified name (<server>_<tool>)");
    callCmd->add_option("tool", toolName, "Qualified tool name")->required();
    callCmd->add_option("arguments", toolArgs, "Tool arguments as a JSON object");

    auto* serveCmd = app.add_subcommand("serve", "Keep servers running; SIGHUP reloads the config");

    CLI11_PARSE(app, argc, argv);

    // Broken pipes to stdio servers are reported as write errors.
    std::signal(SIGPIPE, SIG_IGN);

    // Load config
    auto configResult = configPath.empty() ? mcpdesk::loadConfig() : mcpdesk::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mcpdesk::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (auto const level = mcpdesk::log::levelFromString(config.logLevel))
        mcpdesk::log::setLevel(*level);
    if (verbose)
        mcpdesk::log::setLevel(mcpdesk::log::Level::Debug);

    auto application = mcpdesk::App(std::move(config), configPath);

    if (statusCmd->parsed())
        return application.status();
    if (toolsCmd->parsed())
        return application.listTools(serverId);
    if (callCmd->parsed())
        return application.callTool(toolName, toolArgs);
    if (serveCmd->parsed())
        return application.serve();

    return 1;
}
