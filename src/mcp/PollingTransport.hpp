// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/HttpMessages.hpp>
#include <mcp/Transport.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace mcpdesk
{

constexpr auto DefaultPollInterval = std::chrono::milliseconds { 500 };
constexpr auto DefaultPollExpiry = std::chrono::milliseconds { 30'000 };

/// @brief Last-resort HTTP transport that polls the endpoint for queued replies.
///
/// Messages are POSTed; a request whose POST returns no usable body is tracked
/// and the endpoint is polled with `GET` plus `X-MCP-Poll: true` while any such
/// request is outstanding. Entries older than the expiry are dropped with an error event.
class PollingTransport: public Transport, public std::enable_shared_from_this<PollingTransport>
{
  public:
    PollingTransport(boost::asio::any_io_executor executor,
                     HttpTransportConfig config,
                     std::string serverId,
                     std::chrono::milliseconds pollInterval = DefaultPollInterval,
                     std::chrono::milliseconds expiry = DefaultPollExpiry,
                     std::chrono::milliseconds requestTimeout = std::chrono::seconds(30));

    [[nodiscard]] auto start() -> boost::asio::awaitable<VoidResult> override;
    [[nodiscard]] auto send(nlohmann::json message) -> boost::asio::awaitable<VoidResult> override;
    auto close() -> boost::asio::awaitable<void> override;
    [[nodiscard]] auto isConnected() const -> bool override { return _connected; }
    [[nodiscard]] auto protocol() const -> TransportProtocol override { return TransportProtocol::Polling; }

    [[nodiscard]] auto outstandingCount() const -> std::size_t { return _outstanding.size(); }

  private:
    HttpSession _session;
    std::chrono::milliseconds _pollInterval;
    std::chrono::milliseconds _expiry;
    log::Logger _logger;
    boost::asio::steady_timer _pollTimer;
    std::map<int64_t, std::chrono::steady_clock::time_point> _outstanding;
    bool _connected = false;

    auto pollLoop(std::shared_ptr<PollingTransport> self) -> boost::asio::awaitable<void>;
    auto pollOnce() -> boost::asio::awaitable<void>;
    void deliver(nlohmann::json message);
    void expireOutstanding();
};

} // namespace mcpdesk
