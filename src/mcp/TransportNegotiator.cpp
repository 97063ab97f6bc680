// SPDX-License-Identifier: Apache-2.0
#include "TransportNegotiator.hpp"

#include <core/Log.hpp>
#include <mcp/HttpMessages.hpp>
#include <mcp/StdioTransport.hpp>
#include <mcp/StreamableHttpTransport.hpp>
#include <mcp/WebSocketTransport.hpp>

#include <format>
#include <variant>

namespace mcpdesk
{

namespace asio = boost::asio;

namespace
{
    /// Hosts whose MCP endpoint acknowledges POSTs with empty bodies and pushes
    /// replies over an event stream that cannot carry our Authorization header.
    constexpr std::string_view SimulatedSseHosts[] = {
        "githubcopilot.com",
    };

    auto hostMatches(std::string_view host, std::string_view domain) -> bool
    {
        if (host == domain)
            return true;
        return host.size() > domain.size() && host.ends_with(domain) && host[host.size() - domain.size() - 1] == '.';
    }

    auto makeHttpTransport(const asio::any_io_executor& executor,
                           TransportProtocol protocol,
                           const std::string& serverId,
                           const HttpServerConfig& http,
                           const ConnectOptions& options) -> std::shared_ptr<Transport>
    {
        auto config = HttpTransportConfig { .url = http.url, .headers = http.headers };
        switch (protocol)
        {
            case TransportProtocol::SimulatedSse:
                return std::make_shared<SimulatedSseTransport>(
                    executor, std::move(config), serverId, options.simulatedCatalog, options.simulatedReplyDelay);
            case TransportProtocol::Polling:
                return std::make_shared<PollingTransport>(
                    executor, std::move(config), serverId, options.pollInterval, options.pollExpiry);
            case TransportProtocol::StreamableHttp:
            case TransportProtocol::Stdio:
            case TransportProtocol::WebSocket: break;
        }
        return std::make_shared<StreamableHttpTransport>(std::move(config), serverId);
    }

    /// Runs the handshake over @p transport; a client that fails is closed before returning.
    auto attempt(asio::any_io_executor executor,
                 std::shared_ptr<Transport> transport,
                 std::string serverId,
                 ConnectOptions options,
                 std::stop_token stop) -> asio::awaitable<Result<std::shared_ptr<McpClient>>>
    {
        auto client = std::make_shared<McpClient>(executor, std::move(transport), serverId, options.requestTimeout);
        auto connected = co_await client->connect(options.handshakeTimeout, stop);
        if (connected && stop.stop_requested())
            connected = makeError(ErrorCode::Cancelled, "Connection attempt was cancelled");
        if (!connected)
        {
            co_await client->close();
            co_return std::unexpected(connected.error());
        }
        co_return client;
    }
} // namespace

auto requiresSimulatedSse(std::string_view url) -> bool
{
    auto const parsed = parseUrl(url);
    if (!parsed)
        return false;

    for (auto const domain: SimulatedSseHosts)
    {
        if (hostMatches(parsed->host, domain))
            return true;
    }
    return false;
}

auto httpFallbackChain(std::string_view url) -> std::vector<TransportProtocol>
{
    if (requiresSimulatedSse(url))
        return { TransportProtocol::SimulatedSse };

    return {
        TransportProtocol::StreamableHttp,
        TransportProtocol::SimulatedSse,
        TransportProtocol::Polling,
    };
}

auto connectServer(asio::any_io_executor executor,
                   const std::string& serverId,
                   const ServerConfig& config,
                   const ConnectOptions& options,
                   std::stop_token stop) -> asio::awaitable<Result<std::shared_ptr<McpClient>>>
{
    if (auto const* stdio = std::get_if<StdioServerConfig>(&config.transport))
    {
        auto transport = std::make_shared<StdioTransport>(executor,
                                                          StdioTransportConfig {
                                                              .command = stdio->command,
                                                              .args = stdio->args,
                                                              .env = stdio->env,
                                                              .cwd = stdio->cwd,
                                                          },
                                                          serverId);
        co_return co_await attempt(executor, std::move(transport), serverId, options, stop);
    }

    if (auto const* ws = std::get_if<WebSocketServerConfig>(&config.transport))
    {
        auto transport = std::make_shared<WebSocketTransport>(executor,
                                                              WebSocketTransportConfig {
                                                                  .url = ws->url,
                                                                  .headers = ws->headers,
                                                                  .reconnectAttempts = ws->reconnectAttempts,
                                                                  .reconnectDelay = ws->reconnectDelay,
                                                              },
                                                              serverId,
                                                              options.handshakeTimeout);
        co_return co_await attempt(executor, std::move(transport), serverId, options, stop);
    }

    auto const& http = std::get<HttpServerConfig>(config.transport);
    auto logger = log::Logger(std::format("connect:{}", serverId));
    auto failures = std::string {};

    for (auto const protocol: httpFallbackChain(http.url))
    {
        logger.debug("Trying {} transport for {}", protocolName(protocol), http.url);
        auto transport = makeHttpTransport(executor, protocol, serverId, http, options);
        auto client = co_await attempt(executor, std::move(transport), serverId, options, stop);
        if (client)
            co_return client;
        if (stop.stop_requested())
            co_return makeError(ErrorCode::Cancelled, std::format("Connecting '{}' was cancelled", serverId));

        logger.info("{} transport failed: {}", protocolName(protocol), client.error().message);
        if (!failures.empty())
            failures += "; ";
        failures += std::format("{}: {}", protocolName(protocol), client.error().message);
    }

    co_return makeError(ErrorCode::TransportError, std::format("All transports failed for '{}': {}", serverId, failures));
}

} // namespace mcpdesk
