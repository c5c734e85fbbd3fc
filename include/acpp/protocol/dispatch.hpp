#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Dispatch - one routed JSON-RPC message plus its reply path
// ═══════════════════════════════════════════════════════════════════════════

#include "acpp/protocol/json_rpc.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace acpp {

/// Reply capability for a single request.
///
/// Copies share state: whichever copy answers first wins, every later
/// answer is dropped with a warning.
class Responder {
public:
    using SuccessFn = std::function<void(Json)>;
    using FailureFn = std::function<void(JsonRpcError)>;

    Responder() = default;
    Responder(SuccessFn on_success, FailureFn on_failure);

    void respond(Json result) const;
    void respond_with_error(JsonRpcError error) const;

    [[nodiscard]] bool has_responded() const noexcept;

    /// A responder that never delivers anything
    [[nodiscard]] bool is_bound() const noexcept { return state_ != nullptr; }

private:
    struct State {
        SuccessFn on_success;
        FailureFn on_failure;
        std::atomic<bool> responded{false};
    };

    [[nodiscard]] bool claim() const;

    std::shared_ptr<State> state_;
};

struct RequestDispatch {
    JsonRpcId id;
    std::string method;
    std::optional<Json> params;
    Responder responder;
};

struct NotificationDispatch {
    std::string method;
    std::optional<Json> params;
};

struct ResponseDispatch {
    JsonRpcId id;
    std::optional<Json> result;
    std::optional<JsonRpcError> error;
};

using Dispatch = std::variant<RequestDispatch, NotificationDispatch, ResponseDispatch>;

/// Turn a parsed message into a dispatch; requests get their responder from make_responder
[[nodiscard]] Dispatch to_dispatch(
    JsonRpcMessage message,
    const std::function<Responder(const JsonRpcId&)>& make_responder);

/// Short label for log lines: "request initialize (id 3)"
[[nodiscard]] std::string describe(const Dispatch& dispatch);

}  // namespace acpp
