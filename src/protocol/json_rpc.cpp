#include "acpp/protocol/json_rpc.hpp"

#include <type_traits>

namespace acpp {
namespace {
constexpr std::string_view kJsonRpcVersion{"2.0"};

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

JsonResult<void> check_envelope(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }

    const Json& version_node = payload.at("jsonrpc");
    const bool version_is_string = version_node.is_string();
    if ((version_is_string == false) || (version_node != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }
    return {};
}

JsonResult<std::string> parse_method_field(const Json& payload) {
    const bool has_method_field = payload.contains("method");
    if (has_method_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }

    const Json& method_node = payload.at("method");
    if (method_node.is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "method must be a string"});
    }
    return method_node.get<std::string>();
}

JsonResult<std::optional<Json>> parse_params_field(const Json& payload) {
    std::optional<Json> parsed_params;
    const bool has_params_field = payload.contains("params");
    if (has_params_field == true) {
        const Json& params_node = payload.at("params");
        const bool params_are_valid = is_valid_params_type(params_node);
        if (params_are_valid == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "params must be an object or array"});
        }
        parsed_params = params_node;
    }
    return parsed_params;
}
}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

std::string JsonRpcId::to_string() const {
    return std::visit(
        [](const auto& id_value) -> std::string {
            if constexpr (std::is_same_v<std::decay_t<decltype(id_value)>, std::string>) {
                return id_value;
            } else {
                return std::to_string(id_value);
            }
        },
        value);
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& id_value) { return Json(id_value); }, value);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<JsonRpcError> JsonRpcError::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "error must be a JSON object"});
    }
    if ((payload.contains("code") == false) || (payload.at("code").is_number_integer() == false)) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "error.code must be an integer"});
    }

    JsonRpcError error;
    error.code = payload.at("code").get<std::int64_t>();
    if (payload.contains("message") && payload.at("message").is_string()) {
        error.message = payload.at("message").get<std::string>();
    }
    if (payload.contains("data")) {
        error.data = payload.at("data");
    }
    return error;
}

JsonRpcError JsonRpcError::parse_error(std::string msg) {
    return JsonRpcError{ErrorCode::ParseError, std::move(msg)};
}

JsonRpcError JsonRpcError::invalid_request(std::string msg) {
    return JsonRpcError{ErrorCode::InvalidRequest, std::move(msg)};
}

JsonRpcError JsonRpcError::method_not_found(std::string msg) {
    return JsonRpcError{ErrorCode::MethodNotFound, std::move(msg)};
}

JsonRpcError JsonRpcError::invalid_params(std::string msg) {
    return JsonRpcError{ErrorCode::InvalidParams, std::move(msg)};
}

JsonRpcError JsonRpcError::internal_error(std::string msg) {
    return JsonRpcError{ErrorCode::InternalError, std::move(msg)};
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::string id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::string(std::move(id)), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    auto method = parse_method_field(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    const bool has_id_field = payload.contains("id");
    if (has_id_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    auto parsed_params = parse_params_field(payload);
    if (parsed_params.has_value() == false) {
        return tl::unexpected(parsed_params.error());
    }

    return JsonRpcRequest(std::move(*method), std::move(*parsed_id), std::move(*parsed_params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    auto method = parse_method_field(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    auto parsed_params = parse_params_field(payload);
    if (parsed_params.has_value() == false) {
        return tl::unexpected(parsed_params.error());
    }

    return JsonRpcNotification(std::move(*method), std::move(*parsed_params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse::JsonRpcResponse(JsonRpcId id,
                                 std::optional<Json> result,
                                 std::optional<JsonRpcError> error)
    : id_(std::move(id)),
      result_(std::move(result)),
      error_(std::move(error)) {}

JsonRpcResponse JsonRpcResponse::success(JsonRpcId id, Json result) {
    return JsonRpcResponse(std::move(id), std::move(result), std::nullopt);
}

JsonRpcResponse JsonRpcResponse::failure(JsonRpcId id, JsonRpcError error) {
    return JsonRpcResponse(std::move(id), std::nullopt, std::move(error));
}

const JsonRpcId& JsonRpcResponse::id() const noexcept {
    return id_;
}

bool JsonRpcResponse::is_error() const noexcept {
    return error_.has_value();
}

const std::optional<Json>& JsonRpcResponse::result() const noexcept {
    return result_;
}

const std::optional<JsonRpcError>& JsonRpcResponse::error() const noexcept {
    return error_;
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    if (error_.has_value()) {
        payload["error"] = error_->to_json();
    } else {
        payload["result"] = result_.value_or(Json(nullptr));
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    if (payload.contains("id") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "response must carry exactly one of result or error"});
    }

    if (has_error == true) {
        auto error = JsonRpcError::from_json(payload.at("error"));
        if (error.has_value() == false) {
            return tl::unexpected(error.error());
        }
        return failure(std::move(*parsed_id), std::move(*error));
    }
    return success(std::move(*parsed_id), payload.at("result"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Message classification
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<JsonRpcMessage> parse_message(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    const bool has_id = payload.contains("id");
    const bool has_method = payload.contains("method");

    if (has_method && has_id) {
        return JsonRpcRequest::from_json(payload).map(
            [](JsonRpcRequest request) { return JsonRpcMessage{std::move(request)}; });
    }
    if (has_method) {
        return JsonRpcNotification::from_json(payload).map(
            [](JsonRpcNotification notification) { return JsonRpcMessage{std::move(notification)}; });
    }
    if (has_id) {
        return JsonRpcResponse::from_json(payload).map(
            [](JsonRpcResponse response) { return JsonRpcMessage{std::move(response)}; });
    }

    return tl::unexpected(JsonError{
        JsonError::Code::MissingField,
        "message has neither method nor id"});
}

Json to_json(const JsonRpcMessage& message) {
    return std::visit([](const auto& m) { return m.to_json(); }, message);
}

}  // namespace acpp
