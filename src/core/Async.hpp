// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <vector>

namespace mcpdesk
{

namespace asio = boost::asio;

/// @brief Suspends the calling coroutine for the given duration.
inline auto sleepFor(std::chrono::steady_clock::duration duration) -> asio::awaitable<void>
{
    auto timer = asio::steady_timer(co_await asio::this_coro::executor, duration);
    auto ec = boost::system::error_code {};
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

/// @brief Runs every task concurrently and resumes once all of them have completed.
///
/// Tasks are expected to report their own failures; an exception escaping a task
/// is logged and does not affect its siblings.
inline auto whenAll(std::vector<asio::awaitable<void>> tasks) -> asio::awaitable<void>
{
    if (tasks.empty())
        co_return;

    auto executor = co_await asio::this_coro::executor;
    auto remaining = std::make_shared<std::size_t>(tasks.size());
    auto done = std::make_shared<asio::steady_timer>(executor, asio::steady_timer::time_point::max());

    // co_spawn posts the task start, so no task can finish before the wait below is armed.
    for (auto& task: tasks)
    {
        asio::co_spawn(executor, std::move(task), [remaining, done](std::exception_ptr failure) {
            if (failure)
            {
                try
                {
                    std::rethrow_exception(failure);
                }
                catch (const std::exception& e)
                {
                    log::error("Concurrent task failed: {}", e.what());
                }
            }
            if (--*remaining == 0)
                done->cancel();
        });
    }

    auto ec = boost::system::error_code {};
    co_await done->async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

} // namespace mcpdesk
