// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>

namespace mcpdesk
{

/// @brief Default time a request may stay unanswered before it is failed.
constexpr auto DefaultRequestTimeout = std::chrono::milliseconds { 10'000 };

/// @brief Matches asynchronous JSON-RPC replies to outstanding requests by id.
///
/// Each request is registered with expect() before it is sent, so a reply that
/// arrives while the send is still in flight is not lost. Every entry settles
/// exactly once (reply, rejection, cancellation or timeout) and is removed from
/// the pending map when it settles.
class RequestCorrelator
{
  public:
    struct Pending
    {
        Pending(int64_t requestId, std::chrono::milliseconds window, boost::asio::steady_timer deadline):
            id(requestId), timeout(window), timer(std::move(deadline))
        {
        }

        int64_t id;
        std::chrono::milliseconds timeout;
        boost::asio::steady_timer timer;
        std::optional<Result<nlohmann::json>> outcome;
    };

    using Ticket = std::shared_ptr<Pending>;

    explicit RequestCorrelator(boost::asio::any_io_executor executor,
                               std::chrono::milliseconds timeout = DefaultRequestTimeout);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// @brief Registers a request id and arms its timeout.
    /// @param id The request id the reply will carry.
    /// @param timeout Overrides the correlator's default window for this request.
    [[nodiscard]] auto expect(int64_t id, std::optional<std::chrono::milliseconds> timeout = std::nullopt) -> Ticket;

    /// @brief Suspends until the ticket settles and returns the reply message or the failure.
    /// @param ticket A ticket obtained from expect().
    /// @param stop A stop token; requesting stop abandons the local wait with ErrorCode::Cancelled.
    [[nodiscard]] auto wait(Ticket ticket, std::stop_token stop = {}) -> boost::asio::awaitable<Result<nlohmann::json>>;

    /// @brief Settles the request with the given reply message.
    /// @return False if no such request is pending.
    auto resolve(int64_t id, nlohmann::json reply) -> bool;

    /// @brief Settles the request with an error.
    /// @return False if no such request is pending.
    auto reject(int64_t id, Error error) -> bool;

    /// @brief Settles every pending request with the given error.
    void rejectAll(const Error& error);

    [[nodiscard]] auto contains(int64_t id) const -> bool;
    [[nodiscard]] auto pendingCount() const -> std::size_t;
    [[nodiscard]] auto timeout() const -> std::chrono::milliseconds { return _timeout; }

  private:
    boost::asio::any_io_executor _executor;
    std::chrono::milliseconds _timeout;
    std::map<int64_t, Ticket> _pending;

    auto settle(const Ticket& ticket, Result<nlohmann::json> outcome) -> bool;
};

} // namespace mcpdesk
