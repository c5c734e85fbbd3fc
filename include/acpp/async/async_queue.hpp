#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// AsyncQueue - unbounded multi-producer, single-consumer queue
// ═══════════════════════════════════════════════════════════════════════════
// push() never suspends and may be called from any thread. The consumer
// awaits async_next(), which yields items in push order and returns
// std::nullopt once the queue is closed and drained.

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/use_awaitable.hpp>

#include <deque>
#include <mutex>
#include <optional>
#include <system_error>

namespace acpp {

template <typename T>
class AsyncQueue {
public:
    explicit AsyncQueue(asio::any_io_executor executor)
        : signal_(std::move(executor), 1) {}

    AsyncQueue(const AsyncQueue&) = delete;
    AsyncQueue& operator=(const AsyncQueue&) = delete;

    /// Append an item. Returns false (item dropped) once the queue is closed.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        wake();
        return true;
    }

    /// Stop accepting items. Items already queued are still delivered.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
        }
        wake();
    }

    /// Next item in push order; nullopt after close once drained
    [[nodiscard]] asio::awaitable<std::optional<T>> async_next() {
        for (;;) {
            if (auto item = try_next()) {
                co_return item;
            }
            if (is_closed()) {
                co_return std::nullopt;
            }

            try {
                co_await signal_.async_receive(asio::use_awaitable);
            } catch (const std::system_error&) {
                // Signal channel cancelled: nothing more will arrive
                co_return try_next();
            }
        }
    }

    /// Non-suspending pop
    [[nodiscard]] std::optional<T> try_next() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    // Capacity-1 channel used as an edge trigger; a failed try_send means a
    // wake-up is already pending, which is enough.
    void wake() {
        signal_.try_send(asio::error_code{});
    }

    mutable std::mutex mutex_;
    std::deque<T> items_;
    bool closed_{false};
    asio::experimental::concurrent_channel<void(asio::error_code)> signal_;
};

}  // namespace acpp
