// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <mcp/Connection.hpp>
#include <mcp/Reconciler.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/ServerStatus.hpp>
#include <mcp/TransportNegotiator.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Owns every MCP server connection and the status list shown to the user.
///
/// Servers are started concurrently and fail independently: one server that cannot
/// be reached is marked ServerState::Error while its siblings keep running.
/// Configuration changes are applied with reconcile(), which only touches the
/// servers whose configuration actually changed.
///
/// All members must be used from the executor passed to the constructor.
class ServerManager
{
  public:
    using StatusListener = std::function<void(const std::vector<ServerStatus>&)>;
    using WarningHandler = std::function<void(const std::string&)>;

    explicit ServerManager(boost::asio::any_io_executor executor, ConnectOptions options = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// @brief Publishes every configured server as unloaded, then starts the enabled ones concurrently.
    ///
    /// Never fails as a whole; per-server failures end up in the status list.
    auto initialize(ServerConfigMap configs) -> boost::asio::awaitable<void>;

    /// @brief Parses @p configText and initializes from it.
    /// @return A ConfigError if the text cannot be parsed; no server is touched in that case.
    [[nodiscard]] auto initialize(std::string_view configText) -> boost::asio::awaitable<VoidResult>;

    /// @brief Moves the running set to @p configs, restarting only servers whose configuration changed.
    /// @return The plan that was applied.
    auto reconcile(ServerConfigMap configs) -> boost::asio::awaitable<ReconcilePlan>;

    /// @brief Parses @p configText and reconciles against it.
    /// @return A ConfigError if the text cannot be parsed; the running set is left as it was.
    [[nodiscard]] auto reconcile(std::string_view configText) -> boost::asio::awaitable<VoidResult>;

    /// @brief Closes every connection concurrently and forgets all servers.
    auto shutdownAll() -> boost::asio::awaitable<void>;

    /// @brief Starts a configured server. Does nothing if it is already running or starting.
    ///
    /// This is an explicit request, so a server whose configuration is disabled is started too.
    [[nodiscard]] auto startServer(std::string id) -> boost::asio::awaitable<VoidResult>;

    /// @brief Closes the server's connection, or abandons a start in progress, and marks it stopped.
    auto stopServer(std::string id) -> boost::asio::awaitable<void>;

    /// @brief Stops the server and starts it again once the old connection is fully closed.
    [[nodiscard]] auto restartServer(std::string id) -> boost::asio::awaitable<VoidResult>;

    /// @brief Re-reads the tool list of a running server and updates its status.
    [[nodiscard]] auto refreshTools(std::string id) -> boost::asio::awaitable<Result<std::vector<ToolDefinition>>>;

    /// @brief Invokes a tool on a running server and returns the raw `result` object.
    /// @return ConnectionLost if the server has no live connection.
    [[nodiscard]] auto callTool(std::string id, std::string toolName, nlohmann::json arguments, std::stop_token stop = {})
        -> boost::asio::awaitable<Result<nlohmann::json>>;

    /// @brief Drops the server's connection after a connection-level failure.
    ///
    /// The status becomes @p state with @p message as its error; the old client is closed in the background.
    void evict(const std::string& id, ServerState state, std::string message);

    [[nodiscard]] auto status(std::string_view id) const -> std::optional<ServerStatus>;
    [[nodiscard]] auto statuses() const -> std::vector<ServerStatus>;
    [[nodiscard]] auto configs() const -> const ServerConfigMap& { return _configs; }
    [[nodiscard]] auto isRunning(std::string_view id) const -> bool;

    /// @brief Number of start attempts made for the server so far.
    [[nodiscard]] auto generation(std::string_view id) const -> uint64_t;

    void setStatusListener(StatusListener listener) { _statusListener = std::move(listener); }
    void setWarningHandler(WarningHandler handler) { _warningHandler = std::move(handler); }

  private:
    boost::asio::any_io_executor _executor;
    ConnectOptions _options;
    log::Logger _logger { "registry" };

    ServerConfigMap _configs;
    std::map<std::string, ServerStatus, std::less<>> _statuses;
    std::map<std::string, std::shared_ptr<Connection>, std::less<>> _connections;
    /// A start whose handshake is still running.
    struct PendingStart
    {
        uint64_t generation = 0;
        std::stop_source stop;
        // Cancelled once the start has finished and closed anything it no longer needs.
        std::shared_ptr<boost::asio::steady_timer> finished;
    };

    std::map<std::string, PendingStart, std::less<>> _starting;
    std::map<std::string, uint64_t, std::less<>> _generations;
    std::map<std::string, std::shared_ptr<boost::asio::steady_timer>, std::less<>> _stopping;

    StatusListener _statusListener;
    WarningHandler _warningHandler;

    // Expires with this object; deferred close notifications check it before touching members.
    std::shared_ptr<bool> _lifetime = std::make_shared<bool>(true);

    auto startQuietly(std::string id) -> boost::asio::awaitable<void>;
    auto removeServer(std::string id) -> boost::asio::awaitable<void>;
    auto restartForConfig(std::string id) -> boost::asio::awaitable<void>;
    auto addServer(std::string id) -> boost::asio::awaitable<void>;
    auto waitUntilStopped(const std::string& id) -> boost::asio::awaitable<void>;
    auto cancelStart(std::string id) -> boost::asio::awaitable<void>;
    void finishStart(const std::string& id, const PendingStart& pending);

    void watchConnection(const std::shared_ptr<Connection>& connection);
    void handleConnectionLost(const std::string& id, const std::shared_ptr<Connection>& connection, const std::string& reason);
    auto statusFor(const std::string& id) -> ServerStatus&;
    void publish();
    void warnIfNothingRunning();
};

} // namespace mcpdesk
