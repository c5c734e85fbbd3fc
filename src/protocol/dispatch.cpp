#include "acpp/protocol/dispatch.hpp"

#include "acpp/log/logger.hpp"

#include <format>

namespace acpp {

Responder::Responder(SuccessFn on_success, FailureFn on_failure)
    : state_(std::make_shared<State>()) {
    state_->on_success = std::move(on_success);
    state_->on_failure = std::move(on_failure);
}

bool Responder::claim() const {
    if (state_ == nullptr) {
        ACPP_LOG_WARN("Responder is not bound to a reply path; reply dropped");
        return false;
    }
    if (state_->responded.exchange(true)) {
        ACPP_LOG_WARN("Request already answered; second reply dropped");
        return false;
    }
    return true;
}

void Responder::respond(Json result) const {
    if (claim() && state_->on_success) {
        state_->on_success(std::move(result));
    }
}

void Responder::respond_with_error(JsonRpcError error) const {
    if (claim() && state_->on_failure) {
        state_->on_failure(std::move(error));
    }
}

bool Responder::has_responded() const noexcept {
    return (state_ != nullptr) && state_->responded.load();
}

Dispatch to_dispatch(
    JsonRpcMessage message,
    const std::function<Responder(const JsonRpcId&)>& make_responder) {
    if (auto* request = std::get_if<JsonRpcRequest>(&message)) {
        return RequestDispatch{
            request->id(),
            request->method(),
            request->params(),
            make_responder(request->id())};
    }
    if (auto* notification = std::get_if<JsonRpcNotification>(&message)) {
        return NotificationDispatch{notification->method(), notification->params()};
    }
    auto& response = std::get<JsonRpcResponse>(message);
    return ResponseDispatch{response.id(), response.result(), response.error()};
}

std::string describe(const Dispatch& dispatch) {
    if (const auto* request = std::get_if<RequestDispatch>(&dispatch)) {
        return std::format("request {} (id {})", request->method, request->id.to_string());
    }
    if (const auto* notification = std::get_if<NotificationDispatch>(&dispatch)) {
        return std::format("notification {}", notification->method);
    }
    const auto& response = std::get<ResponseDispatch>(dispatch);
    return std::format("{} response (id {})",
        response.error.has_value() ? "error" : "result", response.id.to_string());
}

}  // namespace acpp
