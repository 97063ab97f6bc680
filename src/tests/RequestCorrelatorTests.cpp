// SPDX-License-Identifier: Apache-2.0
#include <mcp/RequestCorrelator.hpp>

#include <tests/TestSupport.hpp>

#include <boost/asio/io_context.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stop_token>

using namespace mcpdesk;
using namespace std::chrono_literals;

namespace
{
auto resolveLater(RequestCorrelator& correlator, int64_t id, std::chrono::milliseconds delay) -> asio::awaitable<void>
{
    co_await sleepFor(delay);
    correlator.resolve(id, nlohmann::json { { "jsonrpc", "2.0" }, { "id", id }, { "result", { { "ok", true } } } });
}
} // namespace

TEST_CASE("RequestCorrelator resolves a pending request with its reply", "[correlator]")
{
    auto io = asio::io_context {};
    auto correlator = RequestCorrelator(io.get_executor(), 1s);

    auto ticket = correlator.expect(1);
    CHECK(correlator.contains(1));

    asio::co_spawn(io, resolveLater(correlator, 1, 10ms), asio::detached);
    auto const reply = test::runAsync(io, correlator.wait(ticket));

    REQUIRE(reply.has_value());
    CHECK((*reply)["result"]["ok"] == true);
    CHECK(correlator.pendingCount() == 0);
}

TEST_CASE("RequestCorrelator keeps a reply that arrives before the wait", "[correlator]")
{
    auto io = asio::io_context {};
    auto correlator = RequestCorrelator(io.get_executor(), 1s);

    auto ticket = correlator.expect(4);
    CHECK(correlator.resolve(4, nlohmann::json { { "id", 4 } }));
    CHECK(correlator.pendingCount() == 0);

    auto const reply = test::runAsync(io, correlator.wait(ticket));
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"] == 4);
}

TEST_CASE("RequestCorrelator times out after the configured window, not earlier", "[correlator]")
{
    auto io = asio::io_context {};
    auto correlator = RequestCorrelator(io.get_executor(), 150ms);

    auto const started = std::chrono::steady_clock::now();
    auto ticket = correlator.expect(2);
    auto const reply = test::runAsync(io, correlator.wait(ticket));
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::TimeoutError);
    CHECK(reply.error().message == "Request 2 timed out after 150 ms");
    CHECK(elapsed >= 150ms);
    CHECK(elapsed < 2s);
    CHECK(!correlator.contains(2));
}

TEST_CASE("RequestCorrelator per-request timeout overrides the default", "[correlator]")
{
    auto io = asio::io_context {};
    auto correlator = RequestCorrelator(io.get_executor(), 10s);

    auto ticket = correlator.expect(3, 50ms);
    auto const reply = test::runAsync(io, correlator.wait(ticket));

    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::TimeoutError);
}

TEST_CASE("RequestCorrelator settles each request exactly once", "[correlator]")
{
    auto io = asio::io_context {};
    auto correlator = RequestCorrelator(io.get_executor(), 1s);

    auto ticket = correlator.expect(5);
    CHECK(correlator.reject(5, Error { ErrorCode::TransportError, "write failed" }));
    CHECK(!correlator.resolve(5, nlohmann::json::object()));
    CHECK(!correlator.reject(5, Error { ErrorCode::TransportError, "again" }));

    auto const reply = test::runAsync(io, correlator.wait(ticket));
    REQUIRE(!reply.has_value());
    CHECK(reply.error().message == "write failed");
}

TEST_CASE("RequestCorrelator ignores replies for unknown ids", "[correlator]")
{
    auto io = asio::io_context {};
    auto correlator = RequestCorrelator(io.get_executor());

    CHECK(!correlator.resolve(99, nlohmann::json::object()));
    CHECK(correlator.pendingCount() == 0);
}

TEST_CASE("RequestCorrelator rejectAll fails every outstanding request", "[correlator]")
{
    auto io = asio::io_context {};
    auto correlator = RequestCorrelator(io.get_executor(), 5s);

    auto first = correlator.expect(1);
    auto second = correlator.expect(2);
    REQUIRE(correlator.pendingCount() == 2);

    correlator.rejectAll(Error { ErrorCode::ConnectionLost, "Transport closed" });
    CHECK(correlator.pendingCount() == 0);

    auto const a = test::runAsync(io, correlator.wait(first));
    auto const b = test::runAsync(io, correlator.wait(second));
    REQUIRE(!a.has_value());
    REQUIRE(!b.has_value());
    CHECK(a.error().code == ErrorCode::ConnectionLost);
    CHECK(b.error().code == ErrorCode::ConnectionLost);
}

TEST_CASE("RequestCorrelator stop token abandons the wait", "[correlator]")
{
    auto io = asio::io_context {};
    auto correlator = RequestCorrelator(io.get_executor(), 10s);
    auto stopSource = std::stop_source {};

    auto ticket = correlator.expect(8);
    stopSource.request_stop();

    auto const reply = test::runAsync(io, correlator.wait(ticket, stopSource.get_token()));
    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::Cancelled);
    CHECK(!correlator.contains(8));
}
