// SPDX-License-Identifier: Apache-2.0
#include "WebSocketTransport.hpp"

#include <core/JsonUtils.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <format>
#include <type_traits>
#include <utility>

namespace mcpdesk
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

/// @brief One WebSocket connection; operations throw boost::system::system_error.
class WebSocketTransport::Channel
{
  public:
    virtual ~Channel() = default;

    virtual auto open(const Url& url, const HttpHeaders& headers, std::chrono::milliseconds timeout)
        -> asio::awaitable<void> = 0;
    virtual auto read(beast::flat_buffer& buffer) -> asio::awaitable<void> = 0;
    virtual auto write(std::string_view text) -> asio::awaitable<void> = 0;
    virtual auto shutdown() -> asio::awaitable<void> = 0;
    virtual void abort() = 0;
};

namespace
{
    using TlsStream = beast::ssl_stream<beast::tcp_stream>;

    template <typename NextLayer>
    class BasicChannel final: public WebSocketTransport::Channel
    {
      public:
        template <typename... Args>
        explicit BasicChannel(Args&&... args): _ws(std::forward<Args>(args)...)
        {
        }

        auto open(const Url& url, const HttpHeaders& headers, std::chrono::milliseconds timeout)
            -> asio::awaitable<void> override
        {
            auto resolver = tcp::resolver(_ws.get_executor());
            auto const endpoints = co_await resolver.async_resolve(url.host, url.port, asio::use_awaitable);

            beast::get_lowest_layer(_ws).expires_after(timeout);
            co_await beast::get_lowest_layer(_ws).async_connect(endpoints, asio::use_awaitable);

            if constexpr (std::is_same_v<NextLayer, TlsStream>)
            {
                if (!SSL_set_tlsext_host_name(_ws.next_layer().native_handle(), url.host.c_str()))
                    throw boost::system::system_error(boost::system::error_code(
                        static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
                co_await _ws.next_layer().async_handshake(ssl::stream_base::client, asio::use_awaitable);
            }

            // The websocket stream manages its own timeouts from here on.
            beast::get_lowest_layer(_ws).expires_never();
            _ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            _ws.set_option(websocket::stream_base::decorator([headers](websocket::request_type& request) {
                request.set(beast::http::field::user_agent, "mcpdesk");
                for (const auto& [name, value]: headers)
                    request.set(name, value);
            }));

            co_await _ws.async_handshake(url.hostHeader(), url.target, asio::use_awaitable);
            _ws.text(true);
        }

        auto read(beast::flat_buffer& buffer) -> asio::awaitable<void> override
        {
            co_await _ws.async_read(buffer, asio::use_awaitable);
        }

        auto write(std::string_view text) -> asio::awaitable<void> override
        {
            co_await _ws.async_write(asio::buffer(text.data(), text.size()), asio::use_awaitable);
        }

        auto shutdown() -> asio::awaitable<void> override
        {
            co_await _ws.async_close(websocket::close_reason(websocket::close_code::normal, "Transport closed"),
                                     asio::use_awaitable);
        }

        void abort() override
        {
            beast::get_lowest_layer(_ws).close();
        }

      private:
        websocket::stream<NextLayer> _ws;
    };
} // namespace

WebSocketTransport::WebSocketTransport(asio::any_io_executor executor,
                                       WebSocketTransportConfig config,
                                       std::string serverId,
                                       std::chrono::milliseconds handshakeTimeout):
    _executor(executor),
    _config(std::move(config)),
    _handshakeTimeout(handshakeTimeout),
    _logger(std::format("websocket:{}", serverId)),
    _reconnectTimer(executor)
{
}

WebSocketTransport::~WebSocketTransport()
{
    if (_channel)
        _channel->abort();
}

auto WebSocketTransport::start() -> asio::awaitable<VoidResult>
{
    if (_running)
        co_return VoidResult {};

    auto url = parseUrl(_config.url);
    if (!url)
        co_return std::unexpected(url.error());
    if (url->scheme != "ws" && url->scheme != "wss")
        co_return makeError(ErrorCode::InvalidArgument, std::format("Not a WebSocket URL: {}", _config.url));

    _logger.info("Connecting to {}", _config.url);
    _running = true;
    auto connected = co_await connect();
    if (!connected)
        _running = false;
    co_return connected;
}

auto WebSocketTransport::send(nlohmann::json message) -> asio::awaitable<VoidResult>
{
    if (!_running)
        co_return makeError(ErrorCode::TransportError, "Transport not started");

    auto self = shared_from_this();
    _logger.trace("-> {}", message.dump());
    _outbox.push_back(message.dump());

    if (!_connected)
    {
        _logger.debug("Queueing message (not connected)");
        co_return VoidResult {};
    }
    co_return co_await flush();
}

auto WebSocketTransport::close() -> asio::awaitable<void>
{
    auto self = shared_from_this();
    _logger.debug("Closing transport");

    _running = false;
    _connected = false;
    _reconnectTimer.cancel();

    if (auto channel = std::exchange(_channel, nullptr))
    {
        auto failure = std::optional<std::string> {};
        if (_writing)
        {
            channel->abort();
        }
        else
        {
            try
            {
                co_await channel->shutdown();
            }
            catch (const boost::system::system_error& e)
            {
                failure = e.code().message();
            }
        }
        if (failure)
        {
            _logger.debug("Close handshake failed: {}", *failure);
            channel->abort();
        }
    }

    _outbox.clear();
    _reconnectCount = 0;
    emitClose("Transport closed");
}

auto WebSocketTransport::connect() -> asio::awaitable<VoidResult>
{
    auto url = parseUrl(_config.url);
    if (!url)
        co_return std::unexpected(url.error());

    auto channel = std::shared_ptr<Channel> {};
    if (url->secure())
        channel = std::make_shared<BasicChannel<TlsStream>>(_executor, tlsClientContext());
    else
        channel = std::make_shared<BasicChannel<beast::tcp_stream>>(_executor);

    auto failure = std::optional<Error> {};
    try
    {
        co_await channel->open(*url, _config.headers, _handshakeTimeout);
    }
    catch (const boost::system::system_error& e)
    {
        failure = Error { ErrorCode::TransportError,
                          std::format("WebSocket connection to {} failed: {}", _config.url, e.code().message()) };
    }
    if (failure)
        co_return std::unexpected(std::move(*failure));

    if (!_running)
    {
        channel->abort();
        co_return makeError(ErrorCode::Cancelled, "Transport closed while connecting");
    }

    _channel = channel;
    _connected = true;
    _reconnectCount = 0;
    _logger.info("Connected");

    asio::co_spawn(_executor, readLoop(shared_from_this(), channel), asio::detached);

    if (!_outbox.empty())
    {
        _logger.debug("Flushing {} queued message(s)", _outbox.size());
        if (auto const flushed = co_await flush(); !flushed)
            _logger.warning("{}", flushed.error().message);
    }
    co_return VoidResult {};
}

auto WebSocketTransport::flush() -> asio::awaitable<VoidResult>
{
    // The coroutine that is already writing drains everything queued behind it.
    if (_writing)
        co_return VoidResult {};

    _writing = true;
    auto failure = std::optional<Error> {};
    while (_connected && _channel && !_outbox.empty())
    {
        auto channel = _channel;
        auto frame = std::move(_outbox.front());
        _outbox.pop_front();

        try
        {
            co_await channel->write(frame);
        }
        catch (const boost::system::system_error& e)
        {
            failure = Error { ErrorCode::TransportError, std::format("WebSocket write failed: {}", e.code().message()) };
        }

        if (failure)
        {
            // Kept for the next connection.
            if (_running)
                _outbox.push_front(std::move(frame));
            break;
        }
    }
    _writing = false;

    if (failure)
        co_return std::unexpected(std::move(*failure));
    co_return VoidResult {};
}

auto WebSocketTransport::readLoop(std::shared_ptr<WebSocketTransport> self, std::shared_ptr<Channel> channel)
    -> asio::awaitable<void>
{
    auto buffer = beast::flat_buffer {};
    auto reason = std::string {};

    while (true)
    {
        try
        {
            co_await channel->read(buffer);
        }
        catch (const boost::system::system_error& e)
        {
            reason = e.code().message();
            break;
        }

        auto const text = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());

        if (auto message = json::parse(text); message)
        {
            _logger.trace("<- {}", text);
            emitMessage(std::move(*message));
        }
        else
        {
            _logger.warning("Dropping malformed frame: {}", message.error().message);
        }
    }

    // A newer connection or close() owns the transport now.
    if (channel != _channel || !_running)
        co_return;

    _connected = false;
    _channel.reset();
    _logger.warning("Connection lost: {}", reason);
    co_await reconnect();
}

auto WebSocketTransport::reconnect() -> asio::awaitable<void>
{
    while (_running)
    {
        if (_reconnectCount >= _config.reconnectAttempts)
        {
            _logger.error("Max reconnection attempts reached");
            _running = false;
            _outbox.clear();
            emitClose("Max reconnection attempts reached");
            co_return;
        }

        ++_reconnectCount;
        _logger.info("Reconnecting ({}/{})", _reconnectCount, _config.reconnectAttempts);

        _reconnectTimer.expires_after(_config.reconnectDelay * _reconnectCount);
        auto ec = boost::system::error_code {};
        co_await _reconnectTimer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (!_running)
            co_return;

        auto const connected = co_await connect();
        if (connected)
            co_return;

        _logger.warning("{}", connected.error().message);
        emitError(connected.error());
    }
}

} // namespace mcpdesk
