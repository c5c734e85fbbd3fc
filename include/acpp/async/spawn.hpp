#pragma once

// Helpers for detached coroutines whose failures must still be visible.

#include "acpp/log/logger.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <system_error>

namespace acpp {

/// Completion handler for co_spawn that logs an escaped exception
[[nodiscard]] inline auto log_on_exception(std::string task_name) {
    return [task_name = std::move(task_name)](std::exception_ptr error) {
        if (!error) {
            return;
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            ACPP_LOG_ERROR(task_name + " failed: " + e.what());
        }
    };
}

/// Re-check done every tick until it holds or timeout elapses.
/// Returns the final value of done().
[[nodiscard]] inline asio::awaitable<bool> poll_until(
    std::function<bool()> done,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds tick = std::chrono::milliseconds(10)) {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (done() == false) {
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return false;
        }
        timer.expires_after(tick);
        try {
            co_await timer.async_wait(asio::use_awaitable);
        } catch (const std::system_error&) {
            co_return done();
        }
    }
    co_return true;
}

}  // namespace acpp
