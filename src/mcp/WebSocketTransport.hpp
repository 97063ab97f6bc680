// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/Transport.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace mcpdesk
{

struct WebSocketTransportConfig
{
    std::string url;
    HttpHeaders headers;
    int reconnectAttempts = 5;
    std::chrono::milliseconds reconnectDelay { 1000 };
};

/// @brief Duplex transport exchanging one JSON-RPC message per WebSocket text frame.
///
/// After an unexpected disconnect the transport reconnects up to
/// `reconnectAttempts` times, waiting `reconnectDelay * attempt` before each try.
/// Messages sent while disconnected are queued and flushed once the socket is
/// open again. The close event fires on close() or when reconnection gives up.
class WebSocketTransport: public Transport, public std::enable_shared_from_this<WebSocketTransport>
{
  public:
    class Channel;

    WebSocketTransport(boost::asio::any_io_executor executor,
                       WebSocketTransportConfig config,
                       std::string serverId,
                       std::chrono::milliseconds handshakeTimeout = std::chrono::seconds(30));
    ~WebSocketTransport() override;

    [[nodiscard]] auto start() -> boost::asio::awaitable<VoidResult> override;
    [[nodiscard]] auto send(nlohmann::json message) -> boost::asio::awaitable<VoidResult> override;
    auto close() -> boost::asio::awaitable<void> override;
    [[nodiscard]] auto isConnected() const -> bool override { return _connected; }
    [[nodiscard]] auto protocol() const -> TransportProtocol override { return TransportProtocol::WebSocket; }

    [[nodiscard]] auto queuedCount() const -> std::size_t { return _outbox.size(); }

  private:
    boost::asio::any_io_executor _executor;
    WebSocketTransportConfig _config;
    std::chrono::milliseconds _handshakeTimeout;
    log::Logger _logger;
    boost::asio::steady_timer _reconnectTimer;
    std::shared_ptr<Channel> _channel;
    std::deque<std::string> _outbox;
    int _reconnectCount = 0;
    bool _running = false;
    bool _connected = false;
    bool _writing = false;

    auto connect() -> boost::asio::awaitable<VoidResult>;
    auto flush() -> boost::asio::awaitable<VoidResult>;
    auto readLoop(std::shared_ptr<WebSocketTransport> self, std::shared_ptr<Channel> channel)
        -> boost::asio::awaitable<void>;
    auto reconnect() -> boost::asio::awaitable<void>;
};

} // namespace mcpdesk
