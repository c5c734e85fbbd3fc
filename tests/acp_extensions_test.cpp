#include <catch2/catch_test_macros.hpp>

#include "acpp/protocol/acp_extensions.hpp"

using namespace acpp;

// ─────────────────────────────────────────────────────────────────────────────
// Reserved methods
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Both initialize spellings start a handshake", "[acp][methods]") {
    REQUIRE(is_initialize_method("initialize"));
    REQUIRE(is_initialize_method("acp/initialize"));
    REQUIRE_FALSE(is_initialize_method("initialized"));
    REQUIRE_FALSE(is_initialize_method("session/new"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Successor wrapping
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("wrap_successor_payload nests method and params", "[acp][wrap]") {
    Json wrapped = wrap_successor_payload("session/prompt", Json{{"prompt", "hi"}});
    REQUIRE(wrapped == Json{{"method", "session/prompt"}, {"params", {{"prompt", "hi"}}}});

    Json bare = wrap_successor_payload("session/cancel", std::nullopt);
    REQUIRE(bare == Json{{"method", "session/cancel"}});
}

TEST_CASE("unwrap_successor_payload recovers the inner message", "[acp][wrap]") {
    auto inner = unwrap_successor_payload(Json{{"method", "fs/read_text_file"}, {"params", {{"path", "/a"}}}});
    REQUIRE(inner.has_value());
    REQUIRE(inner->method == "fs/read_text_file");
    REQUIRE(*inner->params == Json{{"path", "/a"}});

    auto no_params = unwrap_successor_payload(Json{{"method", "session/cancel"}});
    REQUIRE(no_params.has_value());
    REQUIRE(no_params->params.has_value() == false);

    auto null_params = unwrap_successor_payload(Json{{"method", "session/cancel"}, {"params", nullptr}});
    REQUIRE(null_params.has_value());
    REQUIRE(null_params->params.has_value() == false);
}

TEST_CASE("unwrap_successor_payload rejects malformed wrappers", "[acp][wrap][error]") {
    auto missing = unwrap_successor_payload(std::nullopt);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == JsonError::Code::InvalidParams);

    REQUIRE_FALSE(unwrap_successor_payload(Json::array({"session/new"})).has_value());
    REQUIRE_FALSE(unwrap_successor_payload(Json{{"params", Json::object()}}).has_value());
    REQUIRE_FALSE(unwrap_successor_payload(Json{{"method", 42}}).has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Proxy marker
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("with_proxy_marker adds _meta.proxy and keeps everything else", "[acp][marker]") {
    Json params = {{"protocolVersion", 1}, {"_meta", {{"trace", "abc"}}}};

    Json marked = with_proxy_marker(params);

    REQUIRE(has_proxy_marker(marked));
    REQUIRE(marked["protocolVersion"] == 1);
    REQUIRE(marked["_meta"]["trace"] == "abc");
    REQUIRE_FALSE(has_proxy_marker(params));
}

TEST_CASE("with_proxy_marker builds params when there are none", "[acp][marker]") {
    Json marked = with_proxy_marker(std::nullopt);
    REQUIRE(marked == Json{{"_meta", {{"proxy", true}}}});
}

TEST_CASE("has_proxy_marker requires boolean true", "[acp][marker]") {
    REQUIRE_FALSE(has_proxy_marker(Json{{"_meta", {{"proxy", false}}}}));
    REQUIRE_FALSE(has_proxy_marker(Json{{"_meta", {{"proxy", "true"}}}}));
    REQUIRE_FALSE(has_proxy_marker(Json{{"_meta", true}}));
    REQUIRE_FALSE(has_proxy_marker(Json("proxy")));
}

TEST_CASE("without_proxy_marker drops an emptied _meta", "[acp][marker]") {
    Json stripped = without_proxy_marker(Json{{"protocolVersion", 1}, {"_meta", {{"proxy", true}}}});
    REQUIRE(stripped == Json{{"protocolVersion", 1}});

    Json kept = without_proxy_marker(Json{{"_meta", {{"proxy", true}, {"trace", "abc"}}}});
    REQUIRE(kept == Json{{"_meta", {{"trace", "abc"}}}});

    std::optional<Json> absent;
    REQUIRE(without_proxy_marker(absent).has_value() == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// Capabilities and MCP servers
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("mcp_acp_transport_capability reads only a boolean flag", "[acp][capabilities]") {
    REQUIRE(mcp_acp_transport_capability(Json{{"capabilities", {{"mcp_acp_transport", true}}}}) == true);
    REQUIRE(mcp_acp_transport_capability(Json{{"capabilities", {{"mcp_acp_transport", false}}}}) == false);
    REQUIRE_FALSE(mcp_acp_transport_capability(Json{{"capabilities", Json::object()}}).has_value());
    REQUIRE_FALSE(mcp_acp_transport_capability(Json{{"capabilities", {{"mcp_acp_transport", 1}}}}).has_value());
    REQUIRE_FALSE(mcp_acp_transport_capability(Json(nullptr)).has_value());
}

TEST_CASE("references_acp_servers looks for acp: urls", "[acp][mcp]") {
    Json with_acp = {{"mcpServers", Json::array({
        {{"name", "files"}, {"command", "mcp-files"}},
        {{"name", "tools"}, {"url", "acp:client-tools"}}})}};
    Json without_acp = {{"mcpServers", Json::array({
        {{"name", "remote"}, {"url", "https://example.com/mcp"}}})}};

    REQUIRE(references_acp_servers(with_acp));
    REQUIRE_FALSE(references_acp_servers(without_acp));
    REQUIRE_FALSE(references_acp_servers(Json{{"cwd", "/"}}));
    REQUIRE_FALSE(references_acp_servers(std::nullopt));
}

TEST_CASE("is_acp_url matches the scheme prefix", "[acp][mcp]") {
    REQUIRE(is_acp_url("acp:tools"));
    REQUIRE_FALSE(is_acp_url("http://acp:1"));
    REQUIRE_FALSE(is_acp_url("ACP:tools"));
}
