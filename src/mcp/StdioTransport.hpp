// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;
};

/// @brief Quotes a single argument for /bin/sh if it contains whitespace, quotes,
///        backslashes, '$' or '`'; otherwise returns it unchanged.
[[nodiscard]] auto shellQuoteArgument(std::string_view arg) -> std::string;

/// @brief Builds the one-line shell command for a command and its arguments.
///
/// The command itself is passed through verbatim so users may write pipelines or
/// rely on PATH lookup; only the arguments are escaped.
[[nodiscard]] auto buildShellCommand(const StdioTransportConfig& config) -> std::string;

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns the server through `/bin/sh -c` in its own process group and exchanges
/// newline-delimited JSON-RPC messages over its stdin/stdout. Child stderr is
/// forwarded to the debug log.
class StdioTransport: public Transport, public std::enable_shared_from_this<StdioTransport>
{
  public:
    StdioTransport(boost::asio::any_io_executor executor, StdioTransportConfig config, std::string serverId);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto start() -> boost::asio::awaitable<VoidResult> override;
    [[nodiscard]] auto send(nlohmann::json message) -> boost::asio::awaitable<VoidResult> override;
    auto close() -> boost::asio::awaitable<void> override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto protocol() const -> TransportProtocol override { return TransportProtocol::Stdio; }

    /// @brief Returns the child process id, or -1 when no process is running.
    [[nodiscard]] auto processId() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;

    auto readStdout(std::shared_ptr<StdioTransport> self) -> boost::asio::awaitable<void>;
    auto readStderr(std::shared_ptr<StdioTransport> self) -> boost::asio::awaitable<void>;
    void terminateChild();
};

} // namespace mcpdesk
