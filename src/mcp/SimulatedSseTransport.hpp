// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/HttpMessages.hpp>
#include <mcp/Transport.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <memory>
#include <set>
#include <string>

namespace mcpdesk
{

/// @brief What a SimulatedSseTransport answers on behalf of the remote server.
struct SimulatedCatalog
{
    nlohmann::json serverInfo; ///< `{name, version}` reported by initialize.
    nlohmann::json tools;      ///< Array returned by tools/list.

    /// @brief The tool set of the hosted GitHub MCP endpoint.
    [[nodiscard]] static auto github() -> SimulatedCatalog;
};

/// @brief Default delay before a synthesized reply is delivered.
constexpr auto DefaultSimulatedReplyDelay = std::chrono::milliseconds { 100 };

/// @brief Compatibility transport for endpoints that acknowledge POSTs with empty bodies.
///
/// Such servers push their real replies over an event stream that cannot carry
/// the Authorization header. When a request comes back empty, a reply is
/// synthesized after a short delay: initialize and tools/list are answered from
/// the catalog, every other method with an empty result. Non-empty bodies are
/// delivered unchanged.
class SimulatedSseTransport: public Transport, public std::enable_shared_from_this<SimulatedSseTransport>
{
  public:
    SimulatedSseTransport(boost::asio::any_io_executor executor,
                          HttpTransportConfig config,
                          std::string serverId,
                          SimulatedCatalog catalog = SimulatedCatalog::github(),
                          std::chrono::milliseconds replyDelay = DefaultSimulatedReplyDelay,
                          std::chrono::milliseconds requestTimeout = std::chrono::seconds(30));

    [[nodiscard]] auto start() -> boost::asio::awaitable<VoidResult> override;
    [[nodiscard]] auto send(nlohmann::json message) -> boost::asio::awaitable<VoidResult> override;
    auto close() -> boost::asio::awaitable<void> override;
    [[nodiscard]] auto isConnected() const -> bool override { return _connected; }
    [[nodiscard]] auto protocol() const -> TransportProtocol override { return TransportProtocol::SimulatedSse; }

    /// @brief Number of synthesized replies still waiting for their delay to elapse.
    [[nodiscard]] auto scheduledReplies() const -> std::size_t { return _timers.size(); }

    /// @brief Builds the reply that would be synthesized for a request.
    [[nodiscard]] auto synthesizeReply(const nlohmann::json& request) const -> nlohmann::json;

  private:
    using TimerPtr = std::shared_ptr<boost::asio::steady_timer>;

    boost::asio::any_io_executor _executor;
    HttpSession _session;
    SimulatedCatalog _catalog;
    std::chrono::milliseconds _replyDelay;
    log::Logger _logger;
    std::set<TimerPtr> _timers;
    bool _connected = false;

    void scheduleReply(nlohmann::json reply);
    auto deliverLater(std::shared_ptr<SimulatedSseTransport> self, TimerPtr timer, nlohmann::json reply)
        -> boost::asio::awaitable<void>;
};

} // namespace mcpdesk
