#include "acpp/connection/stream_connection.hpp"

#include "acpp/async/spawn.hpp"
#include "acpp/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/write.hpp>

#include <array>

namespace acpp {

struct StreamConnection::Streams {
    Streams(const asio::any_io_executor& executor, int input_fd, int output_fd)
        : input(executor, input_fd)
        , output(executor, output_fd)
        , outbound(executor) {}

    asio::posix::stream_descriptor input;
    asio::posix::stream_descriptor output;
    AsyncQueue<std::string> outbound;
    std::atomic<bool> writer_done{false};
};

StreamConnection::StreamConnection(
    asio::any_io_executor executor,
    int input_fd,
    int output_fd,
    std::string label)
    : streams_(std::make_shared<Streams>(executor, input_fd, output_fd))
    , label_(std::move(label))
{
    read_buffer_.reserve(4096);
    asio::co_spawn(executor, write_loop(streams_), log_on_exception(label_ + " writer"));
}

StreamConnection::~StreamConnection() {
    // The writer owns a reference to the streams and finishes on its own
    streams_->outbound.close();
    asio::error_code ec;
    streams_->input.close(ec);
}

// ═══════════════════════════════════════════════════════════════════════════
// IConnection
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> StreamConnection::send(Json message) {
    if (closed_) {
        return tl::unexpected(TransportError::closed(label_ + " is closed"));
    }
    std::string line = message.dump();
    line.push_back('\n');
    if (streams_->outbound.push(std::move(line)) == false) {
        return tl::unexpected(TransportError::closed(label_ + ": write side closed"));
    }
    return {};
}

asio::awaitable<TransportResult<Json>> StreamConnection::async_receive() {
    std::array<char, 4096> chunk{};
    for (;;) {
        while (auto line = take_line()) {
            if (line->empty()) {
                continue;
            }
            try {
                co_return Json::parse(*line);
            } catch (const Json::parse_error& e) {
                ACPP_LOG_WARN(label_ + ": skipping malformed line: " + e.what());
            }
        }

        if (end_of_input_ || closed_) {
            co_return tl::unexpected(TransportError::closed(label_ + ": end of stream"));
        }

        try {
            const std::size_t n = co_await streams_->input.async_read_some(
                asio::buffer(chunk), asio::use_awaitable);
            read_buffer_.append(chunk.data(), n);
        } catch (const std::system_error& e) {
            end_of_input_ = true;
            if (e.code() != asio::error::eof && e.code() != asio::error::operation_aborted) {
                ACPP_LOG_DEBUG(label_ + ": read failed: " + e.what());
            }
            // A final line without a trailing newline still counts
            if (read_buffer_.empty() == false) {
                read_buffer_.push_back('\n');
            }
        }
    }
}

asio::awaitable<void> StreamConnection::async_close() {
    if (closed_.exchange(true)) {
        co_return;
    }

    auto streams = streams_;
    streams->outbound.close();
    const bool flushed = co_await poll_until(
        [streams] { return streams->writer_done.load(); }, kFlushTimeout);
    if (flushed == false) {
        ACPP_LOG_DEBUG(label_ + ": output not drained before close");
    }

    asio::error_code ec;
    streams->output.close(ec);

    co_await after_output_closed();

    streams->input.close(ec);
    ACPP_LOG_DEBUG(label_ + " closed");
}

bool StreamConnection::is_open() const {
    return (closed_ == false) && (streams_->outbound.is_closed() == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Internals
// ═══════════════════════════════════════════════════════════════════════════

std::optional<std::string> StreamConnection::take_line() {
    const auto newline = read_buffer_.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = read_buffer_.substr(0, newline);
    read_buffer_.erase(0, newline + 1);
    if (line.empty() == false && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

asio::awaitable<void> StreamConnection::write_loop(std::shared_ptr<Streams> streams) {
    while (auto line = co_await streams->outbound.async_next()) {
        try {
            co_await asio::async_write(streams->output, asio::buffer(*line), asio::use_awaitable);
        } catch (const std::system_error& e) {
            ACPP_LOG_DEBUG(std::string("Write failed: ") + e.what());
            streams->outbound.close();
            break;
        }
    }

    // Closing the write side is what tells the peer no more input is coming
    asio::error_code ec;
    streams->output.close(ec);
    streams->writer_done = true;
}

}  // namespace acpp
