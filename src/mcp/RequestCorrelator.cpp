// SPDX-License-Identifier: Apache-2.0
#include "RequestCorrelator.hpp"

#include <core/Log.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <format>

namespace mcpdesk
{

namespace asio = boost::asio;

RequestCorrelator::RequestCorrelator(asio::any_io_executor executor, std::chrono::milliseconds timeout):
    _executor(std::move(executor)), _timeout(timeout)
{
}

RequestCorrelator::~RequestCorrelator()
{
    rejectAll(Error { ErrorCode::ConnectionLost, "Transport closed" });
}

auto RequestCorrelator::expect(int64_t id, std::optional<std::chrono::milliseconds> timeout) -> Ticket
{
    auto const window = timeout.value_or(_timeout);
    auto ticket = std::make_shared<Pending>(id, window, asio::steady_timer(_executor, window));

    if (auto const existing = _pending.find(id); existing != _pending.end())
    {
        log::warning("Request id {} reused while still pending; failing the older request", id);
        settle(existing->second, makeError(ErrorCode::ProtocolError, std::format("Request {} superseded", id)));
    }

    _pending[id] = ticket;
    return ticket;
}

auto RequestCorrelator::wait(Ticket ticket, std::stop_token stop) -> asio::awaitable<Result<nlohmann::json>>
{
    auto stopWatch = std::stop_callback(stop, [ticket]() {
        asio::post(ticket->timer.get_executor(), [ticket]() {
            if (ticket->outcome)
                return;
            ticket->outcome = makeError(ErrorCode::Cancelled, std::format("Request {} cancelled", ticket->id));
            ticket->timer.cancel();
        });
    });

    if (!ticket->outcome)
    {
        auto ec = boost::system::error_code {};
        co_await ticket->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

    if (!ticket->outcome)
    {
        settle(ticket,
               makeError(ErrorCode::TimeoutError,
                         std::format("Request {} timed out after {} ms", ticket->id, ticket->timeout.count())));
    }

    // A cancelled ticket is settled outside settle(); drop its map entry here.
    if (auto const it = _pending.find(ticket->id); it != _pending.end() && it->second == ticket)
        _pending.erase(it);

    co_return std::move(*ticket->outcome);
}

auto RequestCorrelator::resolve(int64_t id, nlohmann::json reply) -> bool
{
    auto const it = _pending.find(id);
    if (it == _pending.end())
        return false;
    return settle(it->second, std::move(reply));
}

auto RequestCorrelator::reject(int64_t id, Error error) -> bool
{
    auto const it = _pending.find(id);
    if (it == _pending.end())
        return false;
    return settle(it->second, std::unexpected(std::move(error)));
}

void RequestCorrelator::rejectAll(const Error& error)
{
    auto pending = std::move(_pending);
    _pending.clear();
    for (auto& [id, ticket]: pending)
        settle(ticket, std::unexpected(error));
}

auto RequestCorrelator::contains(int64_t id) const -> bool
{
    return _pending.contains(id);
}

auto RequestCorrelator::pendingCount() const -> std::size_t
{
    return _pending.size();
}

auto RequestCorrelator::settle(const Ticket& ticket, Result<nlohmann::json> outcome) -> bool
{
    if (auto const it = _pending.find(ticket->id); it != _pending.end() && it->second == ticket)
        _pending.erase(it);

    if (ticket->outcome)
        return false;

    ticket->outcome = std::move(outcome);
    ticket->timer.cancel();
    return true;
}

} // namespace mcpdesk
