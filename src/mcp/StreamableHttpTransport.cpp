// SPDX-License-Identifier: Apache-2.0
#include "StreamableHttpTransport.hpp"

#include <mcp/JsonRpc.hpp>

#include <format>

namespace mcpdesk
{

namespace asio = boost::asio;

StreamableHttpTransport::StreamableHttpTransport(HttpTransportConfig config,
                                                 std::string serverId,
                                                 std::chrono::milliseconds requestTimeout):
    _session(std::move(config.url), std::move(config.headers), requestTimeout),
    _logger(std::format("http:{}", serverId))
{
}

auto StreamableHttpTransport::start() -> asio::awaitable<VoidResult>
{
    if (auto url = parseUrl(_session.url()); !url)
        co_return std::unexpected(url.error());

    _connected = true;
    _logger.debug("Using {}", _session.url());
    co_return VoidResult {};
}

auto StreamableHttpTransport::send(nlohmann::json message) -> asio::awaitable<VoidResult>
{
    if (!_connected)
        co_return makeError(ErrorCode::TransportError, "Transport not connected");

    _logger.trace("-> {}", message.dump());

    auto const hints = HttpHeaders {
        { "Accept", "application/json, text/event-stream" },
        { "X-Prefer-Sync-Response", "true" },
        { "X-MCP-Transport", "http" },
    };
    auto response = co_await _session.post(message.dump(), hints);
    if (!response)
        co_return std::unexpected(response.error());
    if (!response->ok())
        co_return makeError(ErrorCode::TransportError, describeHttpFailure(*response));

    auto replies = decodeResponseMessages(*response);
    if (replies.empty())
    {
        if (auto const id = jsonrpc::requestId(message); id && jsonrpc::expectsReply(message))
            _logger.debug("Empty response for request {}; reply expected out of band", *id);
        co_return VoidResult {};
    }

    for (auto& reply: replies)
    {
        _logger.trace("<- {}", reply.dump());
        emitMessage(std::move(reply));
    }
    co_return VoidResult {};
}

auto StreamableHttpTransport::close() -> asio::awaitable<void>
{
    if (_connected)
    {
        _connected = false;
        if (auto const terminated = co_await _session.terminate(); !terminated)
            _logger.warning("Failed to terminate session: {}", terminated.error().message);
    }
    emitClose("Transport closed");
}

} // namespace mcpdesk
