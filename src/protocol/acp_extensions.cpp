#include "acpp/protocol/acp_extensions.hpp"

namespace acpp {

namespace {
constexpr const char* kMetaKey = "_meta";
constexpr const char* kProxyKey = "proxy";
constexpr std::string_view kAcpScheme = "acp:";
}  // namespace

bool is_initialize_method(std::string_view method) noexcept {
    return method == methods::kInitialize || method == methods::kAcpInitialize;
}

Json wrap_successor_payload(std::string_view method, const std::optional<Json>& params) {
    Json payload = Json::object();
    payload["method"] = std::string(method);
    if (params.has_value()) {
        payload["params"] = *params;
    }
    return payload;
}

JsonResult<WrappedMessage> unwrap_successor_payload(const std::optional<Json>& params) {
    if (params.has_value() == false || params->is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "wrapped message must be an object"});
    }

    const auto method = params->find("method");
    if (method == params->end() || method->is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "wrapped message is missing a string method"});
    }

    WrappedMessage inner{method->get<std::string>(), std::nullopt};
    const auto inner_params = params->find("params");
    if (inner_params != params->end() && inner_params->is_null() == false) {
        inner.params = *inner_params;
    }
    return inner;
}

bool has_proxy_marker(const Json& value) {
    if (value.is_object() == false) {
        return false;
    }
    const auto meta = value.find(kMetaKey);
    if (meta == value.end() || meta->is_object() == false) {
        return false;
    }
    const auto proxy = meta->find(kProxyKey);
    return proxy != meta->end() && proxy->is_boolean() && proxy->get<bool>();
}

Json with_proxy_marker(const std::optional<Json>& params) {
    Json value = (params.has_value() && params->is_object()) ? *params : Json::object();
    if (value.contains(kMetaKey) == false || value[kMetaKey].is_object() == false) {
        value[kMetaKey] = Json::object();
    }
    value[kMetaKey][kProxyKey] = true;
    return value;
}

Json without_proxy_marker(Json value) {
    if (value.is_object() == false) {
        return value;
    }
    const auto meta = value.find(kMetaKey);
    if (meta == value.end() || meta->is_object() == false) {
        return value;
    }
    meta->erase(kProxyKey);
    if (meta->empty()) {
        value.erase(kMetaKey);
    }
    return value;
}

std::optional<Json> without_proxy_marker(const std::optional<Json>& params) {
    if (params.has_value() == false) {
        return std::nullopt;
    }
    return without_proxy_marker(*params);
}

std::optional<bool> mcp_acp_transport_capability(const Json& result) {
    if (result.is_object() == false) {
        return std::nullopt;
    }
    const auto capabilities = result.find("capabilities");
    if (capabilities == result.end() || capabilities->is_object() == false) {
        return std::nullopt;
    }
    const auto flag = capabilities->find("mcp_acp_transport");
    if (flag == capabilities->end() || flag->is_boolean() == false) {
        return std::nullopt;
    }
    return flag->get<bool>();
}

bool is_acp_url(std::string_view url) noexcept {
    return url.starts_with(kAcpScheme);
}

bool references_acp_servers(const std::optional<Json>& params) {
    if (params.has_value() == false || params->is_object() == false) {
        return false;
    }
    const auto servers = params->find("mcpServers");
    if (servers == params->end() || servers->is_array() == false) {
        return false;
    }
    for (const auto& server : *servers) {
        if (server.is_object() == false) {
            continue;
        }
        const auto url = server.find("url");
        if (url != server.end() && url->is_string() && is_acp_url(url->get_ref<const std::string&>())) {
            return true;
        }
    }
    return false;
}

}  // namespace acpp
