#include "acpp/bridge/mcp_bridge.hpp"

#include "acpp/log/logger.hpp"
#include "acpp/protocol/acp_extensions.hpp"

#include <array>
#include <format>
#include <random>

namespace acpp {

std::string generate_uuid() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        const std::uint64_t word = engine();
        for (std::size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<std::uint8_t>(word >> (j * 8));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string text;
    text.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text.push_back('-');
        }
        text += std::format("{:02x}", bytes[i]);
    }
    return text;
}

McpBridge::McpBridge(ListenerFactory factory, ListenerRelease release)
    : factory_(std::move(factory)), release_(std::move(release)) {}

void McpBridge::attach(EventSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void McpBridge::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════
// Sessions
// ═══════════════════════════════════════════════════════════════════════════

BridgeResult<Json> McpBridge::prepare_session(const std::string& session_key, const Json& session_params) {
    if (!factory_) {
        return tl::unexpected(BridgeError::listener_failed("No listener factory configured"));
    }

    Json rewritten = session_params;
    Session session;

    if (rewritten.is_object() && rewritten.contains("mcpServers") && rewritten["mcpServers"].is_array()) {
        for (auto& server : rewritten["mcpServers"]) {
            if (server.is_object() == false || server.contains("url") == false || server["url"].is_string() == false) {
                continue;
            }
            const std::string acp_url = server["url"].get<std::string>();
            if (is_acp_url(acp_url) == false) {
                continue;
            }

            auto address = factory_(session_key, acp_url);
            if (!address) {
                ACPP_LOG_WARN(std::format("Bridge session {}: listener for {} failed, releasing {} listener(s)",
                                          session_key, acp_url, session.listeners.size()));
                release_listeners(session);
                return tl::unexpected(address.error());
            }
            server["url"] = *address;
            session.listeners[acp_url] = *address;
        }
    }

    ACPP_LOG_DEBUG(std::format("Bridge session {} prepared with {} listener(s)",
                               session_key, session.listeners.size()));

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session_key] = std::move(session);
    return rewritten;
}

void McpBridge::complete_session(const std::string& session_key, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_key);
    if (it == sessions_.end()) {
        ACPP_LOG_WARN("complete_session: unknown session key " + session_key);
        return;
    }
    it->second.session_id = session_id;
    session_keys_[session_id] = session_key;
}

void McpBridge::cancel_session(const std::string& session_key) {
    Session cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_key);
        if (it == sessions_.end()) {
            return;
        }
        if (it->second.session_id.has_value()) {
            session_keys_.erase(*it->second.session_id);
        }
        cancelled = std::move(it->second);
        sessions_.erase(it);
    }
    release_listeners(cancelled);
    ACPP_LOG_DEBUG("Bridge session " + session_key + " cancelled");
}

void McpBridge::release_listeners(const Session& session) const {
    if (!release_) {
        return;
    }
    for (const auto& [acp_url, address] : session.listeners) {
        release_(address);
    }
}

void McpBridge::connection_dropped(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(connection_id);
}

// ═══════════════════════════════════════════════════════════════════════════
// Transport Side
// ═══════════════════════════════════════════════════════════════════════════

BridgeResult<std::string> McpBridge::accept_connection(const std::string& acp_url) {
    std::string connection_id = generate_uuid();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_[connection_id] = acp_url;
    }

    auto delivered = emit(McpConnectionReceived{acp_url, connection_id});
    if (!delivered) {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.erase(connection_id);
        return tl::unexpected(delivered.error());
    }
    return connection_id;
}

BridgeResult<void> McpBridge::forward_to_server(const std::string& connection_id, Dispatch dispatch) {
    if (has_connection(connection_id) == false) {
        return tl::unexpected(BridgeError::unknown_connection(connection_id));
    }
    return emit(McpClientToServer{connection_id, std::move(dispatch)});
}

BridgeResult<void> McpBridge::close_connection(const std::string& connection_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connections_.erase(connection_id) == 0) {
            return tl::unexpected(BridgeError::unknown_connection(connection_id));
        }
    }
    return emit(McpConnectionDisconnected{connection_id});
}

BridgeResult<void> McpBridge::emit(McpBridgeEvent event) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    if (!sink || sink(std::move(event)) == false) {
        return tl::unexpected(BridgeError::not_attached());
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Inspection
// ═══════════════════════════════════════════════════════════════════════════

bool McpBridge::is_session_pending(const std::string& session_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_key);
    return it != sessions_.end() && it->second.session_id.has_value() == false;
}

std::optional<std::string> McpBridge::session_id(const std::string& session_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_key);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.session_id;
}

std::optional<std::string> McpBridge::session_key_for(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = session_keys_.find(id);
    if (it == session_keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> McpBridge::listener_address(
    const std::string& session_key, const std::string& acp_url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session = sessions_.find(session_key);
    if (session == sessions_.end()) {
        return std::nullopt;
    }
    auto listener = session->second.listeners.find(acp_url);
    if (listener == session->second.listeners.end()) {
        return std::nullopt;
    }
    return listener->second;
}

bool McpBridge::has_connection(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.contains(connection_id);
}

std::size_t McpBridge::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

}  // namespace acpp
