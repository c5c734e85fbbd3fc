#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stream Connection - newline-delimited JSON over a pair of descriptors
// ═══════════════════════════════════════════════════════════════════════════
// One JSON value per line in each direction. Blank lines are skipped;
// lines that fail to parse are logged and skipped.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "StreamConnection is only available on POSIX-compatible systems"
#endif

#include "acpp/async/async_queue.hpp"
#include "acpp/connection/connection.hpp"

#include <asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace acpp {

class StreamConnection : public IConnection {
public:
    /// Takes ownership of both descriptors
    StreamConnection(asio::any_io_executor executor, int input_fd, int output_fd, std::string label);
    ~StreamConnection() override;

    StreamConnection(const StreamConnection&) = delete;
    StreamConnection& operator=(const StreamConnection&) = delete;

    [[nodiscard]] TransportResult<void> send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] asio::awaitable<void> async_close() override;
    [[nodiscard]] bool is_open() const override;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    /// Time given to queued output before the write side is cut off
    static constexpr std::chrono::milliseconds kFlushTimeout{250};

protected:
    /// Runs after the output side is closed and before the input side is
    /// released
    [[nodiscard]] virtual asio::awaitable<void> after_output_closed() { co_return; }

private:
    struct Streams;

    [[nodiscard]] static asio::awaitable<void> write_loop(std::shared_ptr<Streams> streams);
    [[nodiscard]] std::optional<std::string> take_line();

    std::shared_ptr<Streams> streams_;
    std::string label_;
    std::string read_buffer_;
    bool end_of_input_{false};
    std::atomic<bool> closed_{false};
};

}  // namespace acpp
