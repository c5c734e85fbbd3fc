#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Conductor protocol extensions
// ═══════════════════════════════════════════════════════════════════════════
// Reserved method names and the JSON shapes the conductor reads or writes
// on top of plain ACP traffic.

#include "acpp/protocol/json_rpc.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace acpp {

namespace methods {
    inline constexpr std::string_view kInitialize = "initialize";
    inline constexpr std::string_view kAcpInitialize = "acp/initialize";
    inline constexpr std::string_view kSessionNew = "session/new";

    /// Proxy-to-successor wrappers; payload is {method, params}
    inline constexpr std::string_view kSuccessorRequest = "_proxy/successor/request";
    inline constexpr std::string_view kSuccessorNotification = "_proxy/successor/notification";

    inline constexpr std::string_view kMcpConnect = "_mcp/connect";
    inline constexpr std::string_view kMcpMessage = "_mcp/message";
    inline constexpr std::string_view kMcpDisconnect = "_mcp/disconnect";
}  // namespace methods

[[nodiscard]] bool is_initialize_method(std::string_view method) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Successor wrapping
// ─────────────────────────────────────────────────────────────────────────────

struct WrappedMessage {
    std::string method;
    std::optional<Json> params;
};

/// {method, params}; params omitted when absent
[[nodiscard]] Json wrap_successor_payload(std::string_view method, const std::optional<Json>& params);

/// Fails with InvalidParams when the payload is not an object or method is
/// missing / not a string
[[nodiscard]] JsonResult<WrappedMessage> unwrap_successor_payload(const std::optional<Json>& params);

// ─────────────────────────────────────────────────────────────────────────────
// Capability markers
// ─────────────────────────────────────────────────────────────────────────────

/// True when value["_meta"]["proxy"] is boolean true
[[nodiscard]] bool has_proxy_marker(const Json& value);

/// Copy of params (or {}) with _meta.proxy = true
[[nodiscard]] Json with_proxy_marker(const std::optional<Json>& params);

/// Remove _meta.proxy; _meta itself goes when it ends up empty
[[nodiscard]] Json without_proxy_marker(Json value);
[[nodiscard]] std::optional<Json> without_proxy_marker(const std::optional<Json>& params);

/// result.capabilities.mcp_acp_transport when it is a boolean
[[nodiscard]] std::optional<bool> mcp_acp_transport_capability(const Json& result);

/// True when params.mcpServers has at least one entry whose url uses the acp: scheme
[[nodiscard]] bool references_acp_servers(const std::optional<Json>& params);

[[nodiscard]] bool is_acp_url(std::string_view url) noexcept;

}  // namespace acpp
