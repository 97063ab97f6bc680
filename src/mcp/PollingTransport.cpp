// SPDX-License-Identifier: Apache-2.0
#include "PollingTransport.hpp"

#include <mcp/JsonRpc.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <format>

namespace mcpdesk
{

namespace asio = boost::asio;

PollingTransport::PollingTransport(asio::any_io_executor executor,
                                   HttpTransportConfig config,
                                   std::string serverId,
                                   std::chrono::milliseconds pollInterval,
                                   std::chrono::milliseconds expiry,
                                   std::chrono::milliseconds requestTimeout):
    _session(std::move(config.url), std::move(config.headers), requestTimeout),
    _pollInterval(pollInterval),
    _expiry(expiry),
    _logger(std::format("polling:{}", serverId)),
    _pollTimer(std::move(executor))
{
}

auto PollingTransport::start() -> asio::awaitable<VoidResult>
{
    if (auto url = parseUrl(_session.url()); !url)
        co_return std::unexpected(url.error());
    if (_connected)
        co_return VoidResult {};

    _connected = true;
    asio::co_spawn(_pollTimer.get_executor(), pollLoop(shared_from_this()), asio::detached);
    co_return VoidResult {};
}

auto PollingTransport::send(nlohmann::json message) -> asio::awaitable<VoidResult>
{
    if (!_connected)
        co_return makeError(ErrorCode::TransportError, "Transport not connected");

    auto self = shared_from_this();
    _logger.trace("-> {}", message.dump());

    auto response = co_await _session.post(message.dump());
    if (!response)
    {
        emitError(response.error());
        co_return std::unexpected(response.error());
    }
    if (!response->ok())
    {
        auto error = Error { ErrorCode::TransportError, describeHttpFailure(*response) };
        emitError(error);
        co_return std::unexpected(std::move(error));
    }

    auto replies = decodeResponseMessages(*response);
    if (!replies.empty())
    {
        for (auto& reply: replies)
            deliver(std::move(reply));
        co_return VoidResult {};
    }

    if (auto const id = jsonrpc::requestId(message); id && jsonrpc::expectsReply(message))
    {
        _logger.debug("Request {} queued for polling", *id);
        _outstanding[*id] = std::chrono::steady_clock::now();
    }
    co_return VoidResult {};
}

auto PollingTransport::close() -> asio::awaitable<void>
{
    _connected = false;
    _pollTimer.cancel();
    _outstanding.clear();
    emitClose("Transport closed");
    co_return;
}

auto PollingTransport::pollLoop(std::shared_ptr<PollingTransport> self) -> asio::awaitable<void>
{
    while (_connected)
    {
        _pollTimer.expires_after(_pollInterval);
        auto ec = boost::system::error_code {};
        co_await _pollTimer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (!_connected)
            break;

        if (!_outstanding.empty())
        {
            co_await pollOnce();
            expireOutstanding();
        }
    }
    _logger.debug("Polling stopped");
}

auto PollingTransport::pollOnce() -> asio::awaitable<void>
{
    _logger.trace("Polling, {} outstanding", _outstanding.size());

    auto response = co_await _session.get({ { "X-MCP-Poll", "true" } });
    if (!response)
    {
        _logger.debug("Poll failed: {}", response.error().message);
        co_return;
    }
    if (!response->ok())
    {
        _logger.debug("Poll returned HTTP {}", response->status);
        co_return;
    }

    for (auto& message: decodeJsonMessages(response->body, true))
        deliver(std::move(message));
}

void PollingTransport::deliver(nlohmann::json message)
{
    if (auto const id = jsonrpc::requestId(message); id && jsonrpc::classify(message) == jsonrpc::MessageKind::Response)
        _outstanding.erase(*id);
    _logger.trace("<- {}", message.dump());
    emitMessage(std::move(message));
}

void PollingTransport::expireOutstanding()
{
    auto const now = std::chrono::steady_clock::now();
    for (auto it = _outstanding.begin(); it != _outstanding.end();)
    {
        if (now - it->second <= _expiry)
        {
            ++it;
            continue;
        }
        auto const id = it->first;
        it = _outstanding.erase(it);
        _logger.warning("Request {} timed out", id);
        emitError(Error { ErrorCode::TimeoutError, std::format("Request {} timed out", id) });
    }
}

} // namespace mcpdesk
