// SPDX-License-Identifier: Apache-2.0
// A minimal stdio MCP server used by the transport and registry tests.
#include <tests/FakeMcp.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <thread>

#include <sys/file.h>

#include <fcntl.h>
#include <unistd.h>

namespace
{

using mcpdesk::test::answerMcpRequest;
using mcpdesk::test::fakeError;
using mcpdesk::test::fakeReply;
using mcpdesk::test::textContent;

auto extraTools() -> nlohmann::json
{
    return nlohmann::json::array({
        { { "name", "sleep" },
          { "description", "Waits for the given number of milliseconds" },
          { "inputSchema", { { "type", "object" }, { "properties", { { "ms", { { "type", "integer" } } } } } } } },
        { { "name", "env" },
          { "description", "Reads an environment variable" },
          { "inputSchema", { { "type", "object" }, { "properties", { { "name", { { "type", "string" } } } } } } } },
        { { "name", "exit" },
          { "description", "Terminates the server without replying" },
          { "inputSchema", { { "type", "object" } } } },
    });
}

/// Appends "<pid> held" or "<pid> contended" to @p path. The lock lives as long as the process.
auto recordLock(const std::string& path) -> bool
{
    auto const fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND, 0644);
    if (fd < 0)
        return false;
    auto const held = ::flock(fd, LOCK_EX | LOCK_NB) == 0;
    auto const line = std::format("{} {}\n", ::getpid(), held ? "held" : "contended");
    return ::write(fd, line.data(), line.size()) == static_cast<ssize_t>(line.size());
}

void emit(const nlohmann::json& message)
{
    std::cout << message.dump() << '\n' << std::flush;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "fake_mcp_server: line-delimited JSON-RPC MCP server for tests" };

    auto name = std::string { "fake-server" };
    auto silent = false;
    auto failInitialize = false;
    auto startDelay = 0;
    auto lockFile = std::string {};

    app.add_option("--name", name, "Server name reported by initialize");
    app.add_flag("--silent", silent, "Never answer tools/call");
    app.add_flag("--fail-initialize", failInitialize, "Reject the initialize request");
    app.add_option("--start-delay", startDelay, "Milliseconds to wait before reading requests");
    app.add_option("--lock-file", lockFile, "Take an exclusive lock on this file and log whether it was free");

    CLI11_PARSE(app, argc, argv);

    if (!lockFile.empty() && !recordLock(lockFile))
        return 2;

    if (startDelay > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(startDelay));
    std::cerr << name << " ready" << std::endl;

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        auto const message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object() || !message.contains("id"))
            continue;

        auto const& id = message["id"];
        auto const method = message.value("method", "");
        auto const params = message.value("params", nlohmann::json::object());

        if (method == "initialize" && failInitialize)
        {
            emit(fakeError(id, -32603, "initialization refused"));
            continue;
        }

        if (method == "tools/list")
        {
            auto reply = *answerMcpRequest(message, name);
            for (auto const& tool: extraTools())
                reply["result"]["tools"].push_back(tool);
            emit(reply);
            continue;
        }

        if (method == "tools/call")
        {
            if (silent)
                continue;

            auto const tool = params.value("name", "");
            auto const arguments = params.value("arguments", nlohmann::json::object());
            if (tool == "sleep")
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(arguments.value("ms", 0)));
                emit(fakeReply(id, textContent("slept")));
                continue;
            }
            if (tool == "env")
            {
                auto const* value = std::getenv(arguments.value("name", "").c_str());
                emit(fakeReply(id, textContent(value ? value : "")));
                continue;
            }
            if (tool == "exit")
                return 3;
        }

        if (auto reply = answerMcpRequest(message, name))
            emit(*reply);
    }

    return 0;
}
