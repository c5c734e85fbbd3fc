#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP-over-ACP Bridge
// ═══════════════════════════════════════════════════════════════════════════
// Lets an agent without native acp: MCP transport reach MCP servers that
// live on the client side of the chain. The conductor drives the bridge
// through IMcpBridge; the bridge's transport side reports back through
// McpBridgeEvent values pushed into the conductor's queue.
//
// Session lifecycle:
//   prepare_session(key, params) -> listeners created, acp: URLs rewritten
//   complete_session(key, id)    -> session/new succeeded
//   cancel_session(key)          -> session/new failed, listeners released

#include "acpp/protocol/dispatch.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace acpp {

// ─────────────────────────────────────────────────────────────────────────────
// Events from the bridge's transport side
// ─────────────────────────────────────────────────────────────────────────────

struct McpConnectionReceived {
    std::string acp_url;
    std::string connection_id;
};

struct McpConnectionEstablished {
    std::string connection_id;
};

struct McpClientToServer {
    std::string connection_id;
    Dispatch dispatch;
};

struct McpConnectionDisconnected {
    std::string connection_id;
};

using McpBridgeEvent = std::variant<
    McpConnectionReceived,
    McpConnectionEstablished,
    McpClientToServer,
    McpConnectionDisconnected>;

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

struct BridgeError {
    enum class Code {
        ListenerFailed,
        UnknownSession,
        UnknownConnection,
        NotAttached
    };

    Code code{};
    std::string message;

    [[nodiscard]] static BridgeError listener_failed(std::string msg) {
        return {Code::ListenerFailed, std::move(msg)};
    }

    [[nodiscard]] static BridgeError unknown_session(const std::string& key) {
        return {Code::UnknownSession, "Unknown bridge session: " + key};
    }

    [[nodiscard]] static BridgeError unknown_connection(const std::string& id) {
        return {Code::UnknownConnection, "Unknown MCP connection: " + id};
    }

    [[nodiscard]] static BridgeError not_attached() {
        return {Code::NotAttached, "Bridge is not attached to a conductor"};
    }
};

template <typename T>
using BridgeResult = tl::expected<T, BridgeError>;

// ─────────────────────────────────────────────────────────────────────────────
// IMcpBridge - what the conductor needs from a bridge
// ─────────────────────────────────────────────────────────────────────────────

class IMcpBridge {
public:
    /// Returns false when the event could not be delivered
    using EventSink = std::function<bool(McpBridgeEvent)>;

    virtual ~IMcpBridge() = default;

    virtual void attach(EventSink sink) = 0;
    virtual void detach() = 0;

    /// Create listeners for every acp: server in a session/new request and
    /// return the params with those URLs replaced by listener addresses
    [[nodiscard]] virtual BridgeResult<Json> prepare_session(
        const std::string& session_key, const Json& session_params) = 0;

    virtual void complete_session(const std::string& session_key, const std::string& session_id) = 0;
    virtual void cancel_session(const std::string& session_key) = 0;

    /// The conductor no longer routes for this connection
    virtual void connection_dropped(const std::string& connection_id) = 0;
};

/// Random RFC 4122 version-4 identifier
[[nodiscard]] std::string generate_uuid();

// ─────────────────────────────────────────────────────────────────────────────
// McpBridge - session and connection tables
// ─────────────────────────────────────────────────────────────────────────────

class McpBridge final : public IMcpBridge {
public:
    /// Creates a listener for one acp: URL and returns the address the agent
    /// should use instead (e.g. "http://127.0.0.1:40123/mcp")
    using ListenerFactory = std::function<BridgeResult<std::string>(
        const std::string& session_key, const std::string& acp_url)>;

    /// Closes a listener created by the factory, given its address
    using ListenerRelease = std::function<void(const std::string& address)>;

    explicit McpBridge(ListenerFactory factory, ListenerRelease release = nullptr);

    // IMcpBridge
    void attach(EventSink sink) override;
    void detach() override;
    [[nodiscard]] BridgeResult<Json> prepare_session(
        const std::string& session_key, const Json& session_params) override;
    void complete_session(const std::string& session_key, const std::string& session_id) override;
    void cancel_session(const std::string& session_key) override;
    void connection_dropped(const std::string& connection_id) override;

    // ─────────────────────────────────────────────────────────────────────────
    // Transport side - called by the listeners
    // ─────────────────────────────────────────────────────────────────────────

    /// An MCP client connected to the listener for acp_url. Returns the new
    /// connection id.
    [[nodiscard]] BridgeResult<std::string> accept_connection(const std::string& acp_url);

    /// A message from the MCP client toward the server on the client side
    [[nodiscard]] BridgeResult<void> forward_to_server(const std::string& connection_id, Dispatch dispatch);

    [[nodiscard]] BridgeResult<void> close_connection(const std::string& connection_id);

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_session_pending(const std::string& session_key) const;
    [[nodiscard]] std::optional<std::string> session_id(const std::string& session_key) const;
    [[nodiscard]] std::optional<std::string> session_key_for(const std::string& session_id) const;
    [[nodiscard]] std::optional<std::string> listener_address(
        const std::string& session_key, const std::string& acp_url) const;
    [[nodiscard]] bool has_connection(const std::string& connection_id) const;
    [[nodiscard]] std::size_t connection_count() const;

private:
    struct Session {
        std::map<std::string, std::string> listeners;  // acp url -> address
        std::optional<std::string> session_id;
    };

    [[nodiscard]] BridgeResult<void> emit(McpBridgeEvent event);
    void release_listeners(const Session& session) const;

    ListenerFactory factory_;
    ListenerRelease release_;

    mutable std::mutex mutex_;
    EventSink sink_;
    std::map<std::string, Session> sessions_;            // by session key
    std::map<std::string, std::string> session_keys_;    // session id -> key
    std::map<std::string, std::string> connections_;     // connection id -> acp url
};

}  // namespace acpp
