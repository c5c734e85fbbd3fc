#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Conductor
// ═══════════════════════════════════════════════════════════════════════════
// Routes JSON-RPC traffic along   client <-> proxy[0] <-> ... <-> agent
//
// Proxies are connected only to the conductor. A proxy reaches its
// successor by sending _proxy/successor/request or
// _proxy/successor/notification; the conductor unwraps those and forwards
// the inner message one hop to the right. Messages travelling left toward a
// proxy arrive wrapped the same way.
//
// Every forwarded request gets a fresh id from a per-conductor counter
// (starting at 1). The pending-request table maps that id back to the
// requester, so responses are correlated rather than routed.
//
// Threading: all conductor state, the event loop and every connection pump
// run on one strand. The io_context may be run by any number of threads.
//
// Usage:
//   acpp::Conductor conductor(io.get_executor(), {
//       .name = "my-conductor",
//       .instantiator = acpp::from_commands({"proxy-cmd", "agent-cmd"}),
//   });
//   asio::co_spawn(io, conductor.connect(std::make_shared<acpp::StdioServerConnector>()),
//                  asio::detached);
//   io.run();
//
// The conductor must outlive the coroutines it spawns: shut it down and let
// connect() complete before destroying it.

#include "acpp/conductor/types.hpp"

#include <asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace acpp {

enum class McpBridgeMode : std::uint8_t {
    Disabled,
    Http  ///< acp: MCP servers are exposed to the agent through local listeners
};

struct ConductorConfig {
    std::string name{"conductor"};
    std::shared_ptr<IInstantiator> instantiator;
    McpBridgeMode mcp_bridge_mode{McpBridgeMode::Disabled};
    std::shared_ptr<IMcpBridge> mcp_bridge;
};

class Conductor {
public:
    Conductor(asio::any_io_executor executor, ConductorConfig config);
    ~Conductor();

    Conductor(const Conductor&) = delete;
    Conductor& operator=(const Conductor&) = delete;
    Conductor(Conductor&&) = delete;
    Conductor& operator=(Conductor&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Connect the client and route until shutdown. Components are created
    /// lazily, on the client's initialize request.
    ///
    /// Fails immediately when the conductor is not uninitialized, already has
    /// a client, or the client cannot be connected.
    [[nodiscard]] asio::awaitable<ConductorResult<void>> connect(std::shared_ptr<IConnector> client_connector);

    /// Close every connection and stop routing. Idempotent.
    [[nodiscard]] asio::awaitable<void> shutdown();

    /// Thread-safe, non-suspending: ask the running event loop to shut down.
    /// Ignored while no client is attached or once shutdown has begun.
    void request_shutdown();

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ConductorState state() const noexcept { return state_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }
    [[nodiscard]] asio::strand<asio::any_io_executor> get_executor() const noexcept { return strand_; }

    // Read these on the conductor's strand or while no thread runs it
    [[nodiscard]] std::size_t proxy_count() const noexcept { return proxies_.size(); }
    [[nodiscard]] std::size_t pending_request_count() const noexcept { return pending_requests_.size(); }
    [[nodiscard]] bool agent_supports_mcp_transport() const noexcept { return agent_supports_mcp_transport_; }

private:
    using ConnectionPtr = std::shared_ptr<IConnection>;

    struct PendingRequest {
        JsonRpcId original_id;
        Responder responder;
        SourceIndex source;  ///< Where the request came from; diagnostics only
    };

    // Lifecycle
    asio::awaitable<ConductorResult<void>> run(std::shared_ptr<IConnector> client_connector);
    asio::awaitable<void> do_shutdown();
    asio::awaitable<void> event_loop();
    asio::awaitable<void> handle(ConductorMessage message);

    // Pumps
    void start_pump(ConnectionPtr connection, SourceIndex source);
    asio::awaitable<void> pump(ConnectionPtr connection, SourceIndex source);
    void on_inbound(const ConnectionPtr& connection, SourceIndex source, Json message);
    [[nodiscard]] bool is_current(const ConnectionPtr& connection, SourceIndex source) const;
    void enqueue(ConductorMessage message);

    // Routing
    asio::awaitable<void> route_left_to_right(std::size_t target_index, Dispatch dispatch);
    void route_right_to_left(SourceIndex source, Dispatch dispatch);
    void correlate(ResponseDispatch response);
    void forward_plain(const ConnectionPtr& target, Dispatch dispatch, SourceIndex origin);
    void forward_wrapped(std::size_t proxy_index, Dispatch dispatch);
    void send_request(const ConnectionPtr& target, std::string method,
                      std::optional<Json> params, PendingRequest pending);
    void reject_not_running(const Dispatch& dispatch);
    [[nodiscard]] ConnectionPtr component_at(std::size_t target_index) const;
    [[nodiscard]] SourceIndex predecessor_of(std::size_t target_index) const;
    [[nodiscard]] JsonRpcId next_request_id();

    // Handshake
    asio::awaitable<void> handle_initialize(RequestDispatch request);
    asio::awaitable<ConductorResult<void>> instantiate_components(InitializeRequest request);
    asio::awaitable<ConductorResult<ConnectionPtr>> connect_component(IConnector& connector, std::string label);
    void forward_initialize(std::size_t target_index, RequestDispatch request);
    void abandon_components();

    // Protocol bridge
    [[nodiscard]] bool should_bridge(const RequestDispatch& request) const;
    [[nodiscard]] bool attach_bridge_session(RequestDispatch& request);
    void on_mcp_connection_received(McpConnectionReceived event);
    void on_mcp_client_to_server(McpClientToServer event);
    void on_mcp_connection_disconnected(McpConnectionDisconnected event);

    ConductorConfig config_;
    asio::strand<asio::any_io_executor> strand_;
    MessageQueue queue_;
    std::atomic<ConductorState> state_{ConductorState::Uninitialized};

    std::atomic<bool> client_connected_{false};
    ConnectionPtr client_;
    std::vector<ConnectionPtr> proxies_;
    ConnectionPtr agent_;
    std::vector<ConnectionPtr> abandoned_;  ///< From failed handshakes; closed at shutdown

    std::unordered_map<std::string, PendingRequest> pending_requests_;
    std::int64_t next_request_id_{1};
    bool agent_supports_mcp_transport_{false};
    std::unordered_map<std::string, std::string> bridge_connections_;  ///< connection id -> acp url
};

}  // namespace acpp
