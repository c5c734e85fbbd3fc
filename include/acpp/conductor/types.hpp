#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Conductor Types
// ═══════════════════════════════════════════════════════════════════════════

#include "acpp/async/async_queue.hpp"
#include "acpp/bridge/mcp_bridge.hpp"
#include "acpp/conductor/conductor_error.hpp"
#include "acpp/connection/connection.hpp"
#include "acpp/protocol/dispatch.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace acpp {

enum class ConductorState : std::uint8_t {
    Uninitialized,
    Initializing,
    Running,
    Shutdown
};

[[nodiscard]] constexpr std::string_view to_string(ConductorState state) noexcept {
    switch (state) {
        case ConductorState::Uninitialized: return "uninitialized";
        case ConductorState::Initializing:  return "initializing";
        case ConductorState::Running:       return "running";
        case ConductorState::Shutdown:      return "shutdown";
    }
    return "unknown";
}

/// Where a message entered the conductor
struct SourceIndex {
    enum class Kind : std::uint8_t { Client, Proxy, Successor };

    Kind kind{Kind::Client};
    std::size_t index{0};  ///< Proxy position; unused otherwise

    [[nodiscard]] static constexpr SourceIndex client() noexcept { return {Kind::Client, 0}; }
    [[nodiscard]] static constexpr SourceIndex proxy(std::size_t i) noexcept { return {Kind::Proxy, i}; }
    [[nodiscard]] static constexpr SourceIndex successor() noexcept { return {Kind::Successor, 0}; }

    [[nodiscard]] constexpr bool is_client() const noexcept { return kind == Kind::Client; }
    [[nodiscard]] constexpr bool is_proxy() const noexcept { return kind == Kind::Proxy; }
    [[nodiscard]] constexpr bool is_successor() const noexcept { return kind == Kind::Successor; }

    friend constexpr bool operator==(const SourceIndex&, const SourceIndex&) = default;
};

[[nodiscard]] std::string to_string(const SourceIndex& source);

// ─────────────────────────────────────────────────────────────────────────────
// Queue payload
// ─────────────────────────────────────────────────────────────────────────────

/// Toward the agent; target_index 0..n-1 is a proxy, n is the agent
struct LeftToRight {
    std::size_t target_index;
    Dispatch dispatch;
};

/// Toward the client
struct RightToLeft {
    SourceIndex source;
    Dispatch dispatch;
};

struct ShutdownRequested {};

using ConductorMessage = std::variant<
    LeftToRight,
    RightToLeft,
    ShutdownRequested,
    McpConnectionReceived,
    McpConnectionEstablished,
    McpClientToServer,
    McpConnectionDisconnected>;

using MessageQueue = AsyncQueue<ConductorMessage>;

// ─────────────────────────────────────────────────────────────────────────────
// Instantiation
// ─────────────────────────────────────────────────────────────────────────────

/// The client's initialize request, as seen by an instantiator
struct InitializeRequest {
    std::string method;
    std::optional<Json> params;
};

struct InstantiatedComponents {
    std::vector<std::shared_ptr<IConnector>> proxies;  ///< Client side first
    std::shared_ptr<IConnector> agent;
};

/// Produces the components of the chain. Called once per handshake attempt.
class IInstantiator {
public:
    virtual ~IInstantiator() = default;

    [[nodiscard]] virtual asio::awaitable<ConductorResult<InstantiatedComponents>>
    async_instantiate(InitializeRequest request) = 0;
};

}  // namespace acpp
