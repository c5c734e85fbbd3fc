#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection Interfaces
// ═══════════════════════════════════════════════════════════════════════════
// A connection is a bidirectional stream of JSON-RPC messages to one peer.
// A connector produces a connection on demand; it is how the conductor
// reaches its client, its proxies and its agent.

#include "acpp/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <memory>

namespace acpp {

class IConnection {
public:
    virtual ~IConnection() = default;

    /// Queue a message for the peer. Never suspends; fails with Closed
    /// once the connection has been closed.
    [[nodiscard]] virtual TransportResult<void> send(Json message) = 0;

    /// Next inbound message, in arrival order. Fails with Closed once the
    /// peer is gone or the connection was closed locally.
    [[nodiscard]] virtual asio::awaitable<TransportResult<Json>> async_receive() = 0;

    /// Release the connection. Idempotent.
    [[nodiscard]] virtual asio::awaitable<void> async_close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

class IConnector {
public:
    virtual ~IConnector() = default;

    /// Open a connection whose I/O runs on executor
    [[nodiscard]] virtual asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
    async_connect(asio::any_io_executor executor) = 0;
};

}  // namespace acpp
