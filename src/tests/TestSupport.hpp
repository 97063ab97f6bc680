// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Async.hpp>
#include <mcp/HttpClient.hpp>
#include <tests/FakeMcp.hpp>

#include <boost/asio/io_context.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpdesk::test
{

/// @brief Path of the fake stdio MCP server built alongside the tests.
[[nodiscard]] auto fakeServerPath() -> std::string;

namespace detail
{
    template <typename T>
    auto capture(asio::awaitable<T> task, std::optional<T>& out) -> asio::awaitable<void>
    {
        out.emplace(co_await std::move(task));
    }
} // namespace detail

/// @brief Drives the io_context until @p task has finished. Background work may remain pending.
inline void runUntilDone(asio::io_context& io, asio::awaitable<void> task)
{
    auto done = false;
    auto failure = std::exception_ptr {};
    asio::co_spawn(io, std::move(task), [&](std::exception_ptr e) {
        failure = e;
        done = true;
    });

    if (io.stopped())
        io.restart();
    while (!done)
    {
        if (io.run_one() == 0)
            break;
    }

    REQUIRE(done);
    if (failure)
        std::rethrow_exception(failure);
}

template <typename T>
[[nodiscard]] auto runAsync(asio::io_context& io, asio::awaitable<T> task) -> T
{
    auto out = std::optional<T> {};
    runUntilDone(io, detail::capture(std::move(task), out));
    REQUIRE(out.has_value());
    return std::move(*out);
}

/// @brief Lets timers and I/O progress for @p duration.
inline void runFor(asio::io_context& io, std::chrono::milliseconds duration)
{
    runUntilDone(io, sleepFor(duration));
}

/// @brief Runs the io_context in small steps until @p predicate holds or @p limit has passed.
/// @return The final value of @p predicate.
template <typename Predicate>
auto waitUntil(asio::io_context& io, Predicate predicate, std::chrono::milliseconds limit = std::chrono::seconds(5))
    -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + limit;
    while (!predicate() && std::chrono::steady_clock::now() < deadline)
        runFor(io, std::chrono::milliseconds(10));
    return predicate();
}

/// @brief A loopback HTTP server on the test's io_context.
class TestHttpServer
{
  public:
    struct Request
    {
        std::string method;
        std::string target;
        HttpHeaders headers; // lowercase names
        std::string body;

        [[nodiscard]] auto header(std::string_view name) const -> std::string;
    };

    struct Reply
    {
        int status = 200;
        std::string contentType = "application/json";
        std::string body;
        HttpHeaders headers;
    };

    using Handler = std::function<Reply(const Request&)>;
    struct State;

    TestHttpServer(asio::io_context& io, Handler handler);
    ~TestHttpServer();

    [[nodiscard]] auto url(std::string_view path = "/mcp") const -> std::string;
    [[nodiscard]] auto requests() const -> const std::vector<Request>&;

  private:
    std::shared_ptr<State> _state;
};

/// @brief A loopback WebSocket server answering with answerMcpRequest().
class TestWebSocketServer
{
  public:
    struct State;

    explicit TestWebSocketServer(asio::io_context& io);
    ~TestWebSocketServer();

    [[nodiscard]] auto url() const -> std::string;

    /// @brief Upgrade requests seen so far, as header maps with lowercase names.
    [[nodiscard]] auto upgradeHeaders() const -> const std::vector<HttpHeaders>&;

    /// @brief Closes every open session from the server side.
    void dropSessions();

  private:
    std::shared_ptr<State> _state;
};

} // namespace mcpdesk::test
