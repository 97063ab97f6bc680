// SPDX-License-Identifier: Apache-2.0
#include "ServerManager.hpp"

#include <core/Async.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <format>

namespace mcpdesk
{

namespace asio = boost::asio;

namespace
{
    auto closeInBackground(std::shared_ptr<Connection> connection) -> asio::awaitable<void>
    {
        co_await connection->client->close();
    }

    auto toToolInfos(const std::vector<ToolDefinition>& tools) -> std::vector<ToolInfo>
    {
        auto infos = std::vector<ToolInfo> {};
        infos.reserve(tools.size());
        for (const auto& tool: tools)
        {
            infos.push_back(ToolInfo {
                .name = tool.name,
                .description = tool.description,
                .inputSchema = tool.inputSchema,
            });
        }
        return infos;
    }
} // namespace

ServerManager::ServerManager(asio::any_io_executor executor, ConnectOptions options):
    _executor(std::move(executor)), _options(std::move(options))
{
}

ServerManager::~ServerManager()
{
    _lifetime.reset();
}

auto ServerManager::initialize(ServerConfigMap configs) -> asio::awaitable<void>
{
    _configs = std::move(configs);

    for (const auto& [id, config]: _configs)
    {
        auto& entry = statusFor(id);
        entry.state = ServerState::Unloaded;
        entry.error.reset();
    }
    publish();

    auto tasks = std::vector<asio::awaitable<void>> {};
    for (const auto& [id, config]: _configs)
    {
        if (config.enabled)
            tasks.push_back(startQuietly(id));
    }

    _logger.info("Starting {} of {} configured MCP servers", tasks.size(), _configs.size());
    co_await whenAll(std::move(tasks));
    warnIfNothingRunning();
}

auto ServerManager::initialize(std::string_view configText) -> asio::awaitable<VoidResult>
{
    auto configs = parseServerConfigs(configText);
    if (!configs)
    {
        _logger.error("Invalid MCP server configuration: {}", configs.error().message);
        co_return std::unexpected(configs.error());
    }
    co_await initialize(std::move(*configs));
    co_return VoidResult {};
}

auto ServerManager::reconcile(ServerConfigMap configs) -> asio::awaitable<ReconcilePlan>
{
    auto plan = computeReconcilePlan(_configs, configs);
    _configs = std::move(configs);

    if (plan.empty())
    {
        _logger.debug("Configuration unchanged, nothing to reconcile");
        co_return plan;
    }

    _logger.info("Reconciling: {} to add, {} to remove, {} to restart, {} unchanged",
                 plan.toAdd.size(),
                 plan.toRemove.size(),
                 plan.toRestart.size(),
                 plan.unchanged.size());

    // Each id is handled by its own task; close-then-start ordering holds within a task.
    auto tasks = std::vector<asio::awaitable<void>> {};
    for (const auto& id: plan.toRemove)
        tasks.push_back(removeServer(id));
    for (const auto& id: plan.toRestart)
        tasks.push_back(restartForConfig(id));
    for (const auto& id: plan.toAdd)
        tasks.push_back(addServer(id));

    co_await whenAll(std::move(tasks));
    warnIfNothingRunning();
    co_return plan;
}

auto ServerManager::reconcile(std::string_view configText) -> asio::awaitable<VoidResult>
{
    auto configs = parseServerConfigs(configText);
    if (!configs)
    {
        _logger.error("Invalid MCP server configuration, keeping current servers: {}", configs.error().message);
        co_return std::unexpected(configs.error());
    }
    co_await reconcile(std::move(*configs));
    co_return VoidResult {};
}

auto ServerManager::shutdownAll() -> asio::awaitable<void>
{
    _logger.info("Shutting down {} MCP connections", _connections.size());

    // Starts still in flight close their half-open client before the connections go.
    auto cancels = std::vector<asio::awaitable<void>> {};
    for (const auto& [id, pending]: _starting)
        cancels.push_back(cancelStart(id));
    co_await whenAll(std::move(cancels));

    auto tasks = std::vector<asio::awaitable<void>> {};
    for (auto& [id, connection]: _connections)
        tasks.push_back(closeInBackground(connection));
    _connections.clear();

    co_await whenAll(std::move(tasks));

    _statuses.clear();
    publish();
}

auto ServerManager::startServer(std::string id) -> asio::awaitable<VoidResult>
{
    co_await waitUntilStopped(id);

    auto const configIt = _configs.find(id);
    if (configIt == _configs.end())
        co_return makeError(ErrorCode::ConfigError, std::format("Unknown server '{}'", id));

    if (_connections.contains(id) || _starting.contains(id))
    {
        _logger.debug("Server '{}' is already running or starting", id);
        co_return VoidResult {};
    }

    auto const config = configIt->second;
    auto const pending = PendingStart {
        .generation = ++_generations[id],
        .stop = std::stop_source {},
        .finished = std::make_shared<asio::steady_timer>(_executor, asio::steady_timer::time_point::max()),
    };
    _starting[id] = pending;

    auto& entry = statusFor(id);
    entry.state = ServerState::Starting;
    entry.error.reset();
    entry.tools.clear();
    entry.protocol.reset();
    publish();

    _logger.info("Starting MCP server '{}' ({})", id, transportKindName(config.kind()));

    auto client = co_await connectServer(_executor, id, config, _options, pending.stop.get_token());

    auto tools = std::vector<ToolDefinition> {};
    if (client && !pending.stop.stop_requested() && (*client)->capabilities().hasTools)
    {
        auto listed = co_await (*client)->listTools();
        if (listed)
            tools = std::move(*listed);
        else
            _logger.warning("Failed to list tools for server '{}': {}", id, listed.error().message);
    }

    // Stopped, removed or restarted while we were connecting.
    if (pending.stop.stop_requested())
    {
        if (client)
            co_await (*client)->close();
        finishStart(id, pending);
        _logger.debug("Discarding superseded start of '{}'", id);
        co_return makeError(ErrorCode::Cancelled, std::format("Start of server '{}' was cancelled", id));
    }
    finishStart(id, pending);

    auto& status = statusFor(id);
    if (!client)
    {
        _logger.error("Failed to start MCP server '{}': {}", id, client.error().message);
        status.state = ServerState::Error;
        status.error = client.error().message;
        publish();
        co_return std::unexpected(client.error());
    }

    auto connection = std::make_shared<Connection>(Connection {
        .serverId = id,
        .config = config,
        .client = std::move(*client),
    });
    watchConnection(connection);
    _connections[id] = connection;

    status.state = ServerState::Running;
    status.tools = toToolInfos(tools);
    status.protocol = connection->protocol();
    publish();

    _logger.info("MCP server '{}' running with {} tools via {}",
                 id,
                 tools.size(),
                 protocolName(connection->protocol()));
    co_return VoidResult {};
}

auto ServerManager::stopServer(std::string id) -> asio::awaitable<void>
{
    co_await waitUntilStopped(id);

    // New starts of this id wait here until the old process is gone.
    auto gate = std::make_shared<asio::steady_timer>(_executor, asio::steady_timer::time_point::max());
    _stopping[id] = gate;

    co_await cancelStart(id);

    auto connection = std::shared_ptr<Connection> {};
    if (auto const it = _connections.find(id); it != _connections.end())
    {
        connection = it->second;
        _connections.erase(it);
    }

    if (auto const it = _statuses.find(id); it != _statuses.end())
    {
        it->second.state = ServerState::Stopped;
        it->second.error.reset();
        it->second.tools.clear();
        publish();
    }

    if (connection)
    {
        _logger.info("Stopping MCP server '{}'", id);
        co_await connection->client->close();
    }

    _stopping.erase(id);
    gate->cancel();
}

auto ServerManager::restartServer(std::string id) -> asio::awaitable<VoidResult>
{
    if (!_configs.contains(id))
        co_return makeError(ErrorCode::ConfigError, std::format("Unknown server '{}'", id));

    co_await stopServer(id);
    co_return co_await startServer(std::move(id));
}

auto ServerManager::refreshTools(std::string id) -> asio::awaitable<Result<std::vector<ToolDefinition>>>
{
    auto const it = _connections.find(id);
    if (it == _connections.end())
        co_return makeError(ErrorCode::ConnectionLost, std::format("No active connection for server '{}'", id));

    auto connection = it->second;
    auto tools = co_await connection->client->listTools();
    if (!tools)
        co_return std::unexpected(tools.error());

    // The connection may have been replaced while the request was in flight.
    if (auto const current = _connections.find(id); current != _connections.end() && current->second == connection)
    {
        statusFor(id).tools = toToolInfos(*tools);
        publish();
    }
    co_return tools;
}

auto ServerManager::callTool(std::string id, std::string toolName, nlohmann::json arguments, std::stop_token stop)
    -> asio::awaitable<Result<nlohmann::json>>
{
    auto const it = _connections.find(id);
    if (it == _connections.end())
        co_return makeError(ErrorCode::ConnectionLost, std::format("No active connection for server '{}'", id));

    // Held for the duration of the call so an eviction cannot destroy the client under us.
    auto connection = it->second;
    co_return co_await connection->client->callTool(toolName, std::move(arguments), std::move(stop));
}

void ServerManager::evict(const std::string& id, ServerState state, std::string message)
{
    auto const it = _connections.find(id);
    if (it == _connections.end())
        return;

    auto connection = it->second;
    _connections.erase(it);

    _logger.warning("Evicting MCP server '{}': {}", id, message);

    auto& status = statusFor(id);
    status.state = state;
    status.error = std::move(message);
    status.tools.clear();
    publish();

    asio::co_spawn(_executor, closeInBackground(std::move(connection)), asio::detached);
}

auto ServerManager::status(std::string_view id) const -> std::optional<ServerStatus>
{
    if (auto const it = _statuses.find(id); it != _statuses.end())
        return it->second;
    return std::nullopt;
}

auto ServerManager::statuses() const -> std::vector<ServerStatus>
{
    auto result = std::vector<ServerStatus> {};
    result.reserve(_statuses.size());
    for (const auto& [id, status]: _statuses)
        result.push_back(status);
    return result;
}

auto ServerManager::isRunning(std::string_view id) const -> bool
{
    return _connections.find(id) != _connections.end();
}

auto ServerManager::generation(std::string_view id) const -> uint64_t
{
    if (auto const it = _generations.find(id); it != _generations.end())
        return it->second;
    return 0;
}

auto ServerManager::startQuietly(std::string id) -> asio::awaitable<void>
{
    // Failures are recorded in the status list by startServer().
    if (auto const started = co_await startServer(id); !started)
        _logger.debug("Start of '{}' did not complete: {}", id, started.error().message);
}

auto ServerManager::removeServer(std::string id) -> asio::awaitable<void>
{
    co_await stopServer(id);
    _statuses.erase(id);
    publish();
    _logger.info("Removed MCP server '{}'", id);
}

auto ServerManager::restartForConfig(std::string id) -> asio::awaitable<void>
{
    co_await stopServer(id);

    auto const it = _configs.find(id);
    if (it == _configs.end())
        co_return;

    auto& entry = statusFor(id);
    entry.name = it->second.name;
    entry.description = it->second.description;

    if (!it->second.enabled)
    {
        publish();
        co_return;
    }
    co_await startQuietly(std::move(id));
}

auto ServerManager::addServer(std::string id) -> asio::awaitable<void>
{
    auto const it = _configs.find(id);
    if (it == _configs.end())
        co_return;

    auto& entry = statusFor(id);
    entry.state = ServerState::Unloaded;
    publish();

    if (it->second.enabled)
        co_await startQuietly(std::move(id));
}

auto ServerManager::waitUntilStopped(const std::string& id) -> asio::awaitable<void>
{
    for (auto it = _stopping.find(id); it != _stopping.end(); it = _stopping.find(id))
    {
        auto gate = it->second;
        auto ec = boost::system::error_code {};
        co_await gate->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

auto ServerManager::cancelStart(std::string id) -> asio::awaitable<void>
{
    auto const it = _starting.find(id);
    if (it == _starting.end())
        co_return;

    _logger.debug("Cancelling start of '{}'", id);
    auto const finished = it->second.finished;
    it->second.stop.request_stop();

    auto ec = boost::system::error_code {};
    co_await finished->async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

void ServerManager::finishStart(const std::string& id, const PendingStart& pending)
{
    if (auto const it = _starting.find(id); it != _starting.end() && it->second.generation == pending.generation)
        _starting.erase(it);
    pending.finished->cancel();
}

void ServerManager::watchConnection(const std::shared_ptr<Connection>& connection)
{
    // The client reports the close from inside its own event handler, so the
    // eviction that may destroy it is deferred to the executor.
    connection->client->setCloseHandler(
        [this, lifetime = std::weak_ptr<bool>(_lifetime), weak = std::weak_ptr<Connection>(connection)](
            const std::string& reason) {
            asio::post(_executor, [this, lifetime, weak, reason]() {
                auto const alive = lifetime.lock();
                auto const connection = weak.lock();
                if (alive && connection)
                    handleConnectionLost(connection->serverId, connection, reason);
            });
        });
}

void ServerManager::handleConnectionLost(const std::string& id,
                                         const std::shared_ptr<Connection>& connection,
                                         const std::string& reason)
{
    auto const it = _connections.find(id);
    if (it == _connections.end() || it->second != connection)
        return;

    evict(id, ServerState::Error, std::format("Connection lost: {}", reason));
}

auto ServerManager::statusFor(const std::string& id) -> ServerStatus&
{
    auto [it, inserted] = _statuses.try_emplace(id);
    auto& entry = it->second;
    if (inserted)
        entry.id = id;

    if (auto const config = _configs.find(id); config != _configs.end())
    {
        entry.name = config->second.name;
        entry.description = config->second.description;
    }
    return entry;
}

void ServerManager::publish()
{
    if (_statusListener)
        _statusListener(statuses());
}

void ServerManager::warnIfNothingRunning()
{
    auto const anyEnabled = std::ranges::any_of(_configs, [](const auto& entry) { return entry.second.enabled; });
    if (!anyEnabled || !_connections.empty())
        return;

    auto const message = std::string("No MCP servers could be started. Check the server configuration.");
    _logger.warning("{}", message);
    if (_warningHandler)
        _warningHandler(message);
}

} // namespace mcpdesk
