#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace acpp {

using Json = nlohmann::json;

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

/// Standard JSON-RPC 2.0 error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}  // namespace ErrorCode

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    /// Key form used for correlation tables ("7" for 7, "abc" for "abc")
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] Json to_json() const;

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcError> from_json(const Json& payload);

    [[nodiscard]] static JsonRpcError parse_error(std::string msg);
    [[nodiscard]] static JsonRpcError invalid_request(std::string msg);
    [[nodiscard]] static JsonRpcError method_not_found(std::string msg);
    [[nodiscard]] static JsonRpcError invalid_params(std::string msg);
    [[nodiscard]] static JsonRpcError internal_error(std::string msg);
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, std::string id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcNotification> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> params_;
};

/// A response carries exactly one of result or error.
class JsonRpcResponse {
public:
    [[nodiscard]] static JsonRpcResponse success(JsonRpcId id, Json result);
    [[nodiscard]] static JsonRpcResponse failure(JsonRpcId id, JsonRpcError error);

    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] bool is_error() const noexcept;
    [[nodiscard]] const std::optional<Json>& result() const noexcept;
    [[nodiscard]] const std::optional<JsonRpcError>& error() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

private:
    JsonRpcResponse(JsonRpcId id, std::optional<Json> result, std::optional<JsonRpcError> error);

    JsonRpcId id_;
    std::optional<Json> result_;
    std::optional<JsonRpcError> error_;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification, JsonRpcResponse>;

/// Classify and parse any inbound message:
/// - Request: has "method" AND "id"
/// - Notification: has "method" but NO "id"
/// - Response: has "id" but NO "method"
JsonResult<JsonRpcMessage> parse_message(const Json& payload);

[[nodiscard]] Json to_json(const JsonRpcMessage& message);

}  // namespace acpp
