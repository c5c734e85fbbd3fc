#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// In-Process Connections
// ═══════════════════════════════════════════════════════════════════════════
// Connected pairs of message queues. Used to run components inside the
// conductor's process and to drive the conductor from tests.

#include "acpp/async/async_queue.hpp"
#include "acpp/connection/connection.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace acpp {

class ChannelConnection final : public IConnection {
public:
    struct Link;

    ChannelConnection(std::shared_ptr<Link> link, bool left_end);
    ~ChannelConnection() override;

    ChannelConnection(const ChannelConnection&) = delete;
    ChannelConnection& operator=(const ChannelConnection&) = delete;

    [[nodiscard]] TransportResult<void> send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] asio::awaitable<void> async_close() override;
    [[nodiscard]] bool is_open() const override;

    /// Synchronous close; both directions end for both sides
    void close();

private:
    [[nodiscard]] AsyncQueue<Json>& inbound() const;
    [[nodiscard]] AsyncQueue<Json>& outbound() const;

    std::shared_ptr<Link> link_;
    bool left_end_;
    std::atomic<bool> closed_{false};
};

struct ChannelPair {
    std::unique_ptr<ChannelConnection> left;
    std::unique_ptr<ChannelConnection> right;
};

/// Two connected ends: whatever one side sends, the other receives
[[nodiscard]] ChannelPair make_channel_pair(asio::any_io_executor executor);

// ─────────────────────────────────────────────────────────────────────────────
// Connectors
// ─────────────────────────────────────────────────────────────────────────────

/// Runs a component as a coroutine on the conductor's executor. Each
/// connect spawns handler with the far end of a fresh channel pair.
class InProcessConnector final : public IConnector {
public:
    using Handler = std::function<asio::awaitable<void>(std::shared_ptr<IConnection>)>;

    explicit InProcessConnector(Handler handler, std::string name = "in-process component");

    [[nodiscard]] asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
    async_connect(asio::any_io_executor executor) override;

private:
    Handler handler_;
    std::string name_;
};

/// Hands out one connection that already exists. A second connect fails.
class PreconnectedConnector final : public IConnector {
public:
    explicit PreconnectedConnector(std::unique_ptr<IConnection> connection);

    [[nodiscard]] asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
    async_connect(asio::any_io_executor executor) override;

private:
    std::mutex mutex_;
    std::unique_ptr<IConnection> connection_;
};

}  // namespace acpp
