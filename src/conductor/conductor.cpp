#include "acpp/conductor/conductor.hpp"

#include "acpp/async/spawn.hpp"
#include "acpp/log/logger.hpp"
#include "acpp/protocol/acp_extensions.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <format>

namespace acpp {

namespace {

/// Replies to a request on the connection it arrived on
Responder make_connection_responder(std::weak_ptr<IConnection> connection, JsonRpcId id, std::string peer) {
    auto deliver = [connection, peer](const JsonRpcResponse& response) {
        auto target = connection.lock();
        if (!target) {
            ACPP_LOG_DEBUG("Reply to " + peer + " dropped: connection is gone");
            return;
        }
        auto sent = target->send(response.to_json());
        if (!sent) {
            ACPP_LOG_WARN("Reply to " + peer + " failed: " + sent.error().message);
        }
    };

    return Responder(
        [deliver, id](Json result) { deliver(JsonRpcResponse::success(id, std::move(result))); },
        [deliver, id](JsonRpcError error) { deliver(JsonRpcResponse::failure(id, std::move(error))); });
}

asio::awaitable<void> close_all(std::vector<std::shared_ptr<IConnection>> connections) {
    if (connections.empty()) {
        co_return;
    }

    auto executor = co_await asio::this_coro::executor;
    auto done = std::make_shared<asio::experimental::channel<void(asio::error_code)>>(
        executor, connections.size());

    for (auto& connection : connections) {
        asio::co_spawn(executor, connection->async_close(),
            [done](std::exception_ptr error) {
                log_on_exception("Closing connection")(error);
                done->try_send(asio::error_code{});
            });
    }
    for (std::size_t i = 0; i < connections.size(); ++i) {
        co_await done->async_receive(asio::use_awaitable);
    }
}

Json mcp_message_payload(const std::string& connection_id, const std::string& method, const std::optional<Json>& params) {
    Json payload = {{"connectionId", connection_id}, {"method", method}};
    if (params.has_value()) {
        payload["params"] = *params;
    }
    return payload;
}

}  // namespace

std::string to_string(const SourceIndex& source) {
    switch (source.kind) {
        case SourceIndex::Kind::Client:    return "client";
        case SourceIndex::Kind::Proxy:     return std::format("proxy[{}]", source.index);
        case SourceIndex::Kind::Successor: return "agent";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

Conductor::Conductor(asio::any_io_executor executor, ConductorConfig config)
    : config_(std::move(config))
    , strand_(asio::make_strand(executor))
    , queue_(strand_)
{
    if (config_.mcp_bridge) {
        config_.mcp_bridge->attach([this](McpBridgeEvent event) {
            return std::visit(
                [this](auto&& e) { return queue_.push(ConductorMessage{std::forward<decltype(e)>(e)}); },
                std::move(event));
        });
    }
}

Conductor::~Conductor() {
    if (config_.mcp_bridge) {
        config_.mcp_bridge->detach();
    }
    queue_.close();
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ConductorResult<void>> Conductor::connect(std::shared_ptr<IConnector> client_connector) {
    co_return co_await asio::co_spawn(strand_, run(std::move(client_connector)), asio::use_awaitable);
}

asio::awaitable<void> Conductor::shutdown() {
    co_await asio::co_spawn(strand_, do_shutdown(), asio::use_awaitable);
}

void Conductor::request_shutdown() {
    if (client_connected_ == false) {
        ACPP_LOG_DEBUG(config_.name + ": no client attached; ignoring shutdown request");
        return;
    }
    if (queue_.push(ShutdownRequested{}) == false) {
        ACPP_LOG_DEBUG(config_.name + ": shutdown already in progress");
    }
}

asio::awaitable<ConductorResult<void>> Conductor::run(std::shared_ptr<IConnector> client_connector) {
    if (state_ != ConductorState::Uninitialized || client_connected_) {
        co_return tl::unexpected(ConductorError::invalid_state(
            std::format("connect() called on a {} conductor{}",
                        to_string(state_.load()),
                        client_connected_ ? " that already has a client" : "")));
    }
    if (!client_connector) {
        co_return tl::unexpected(ConductorError::invalid_state("No client connector"));
    }

    client_connected_ = true;
    TransportResult<std::unique_ptr<IConnection>> connected;
    try {
        connected = co_await client_connector->async_connect(strand_);
    } catch (const std::exception& e) {
        connected = tl::unexpected(TransportError::network(e.what()));
    }
    if (!connected) {
        client_connected_ = false;
        co_return tl::unexpected(ConductorError::connection_failed("client", connected.error()));
    }
    client_ = std::move(*connected);

    if (state_ == ConductorState::Shutdown) {
        co_await client_->async_close();
        co_return tl::unexpected(ConductorError::shut_down());
    }

    ACPP_LOG_INFO(config_.name + ": client connected");
    start_pump(client_, SourceIndex::client());

    co_await event_loop();

    ACPP_LOG_INFO(config_.name + ": stopped");
    co_return ConductorResult<void>{};
}

asio::awaitable<void> Conductor::do_shutdown() {
    if (state_.exchange(ConductorState::Shutdown) == ConductorState::Shutdown) {
        co_return;
    }
    ACPP_LOG_INFO(config_.name + ": shutting down");

    queue_.close();

    std::vector<ConnectionPtr> connections;
    if (client_) {
        connections.push_back(client_);
    }
    connections.insert(connections.end(), proxies_.begin(), proxies_.end());
    if (agent_) {
        connections.push_back(agent_);
    }
    connections.insert(connections.end(), abandoned_.begin(), abandoned_.end());

    co_await close_all(std::move(connections));
    ACPP_LOG_DEBUG(config_.name + ": all connections closed");
}

asio::awaitable<void> Conductor::event_loop() {
    while (auto message = co_await queue_.async_next()) {
        try {
            co_await handle(std::move(*message));
        } catch (const std::exception& e) {
            ACPP_LOG_ERROR(config_.name + ": error while handling message: " + e.what());
        }
    }
}

asio::awaitable<void> Conductor::handle(ConductorMessage message) {
    if (auto* ltr = std::get_if<LeftToRight>(&message)) {
        co_await route_left_to_right(ltr->target_index, std::move(ltr->dispatch));
    } else if (auto* rtl = std::get_if<RightToLeft>(&message)) {
        route_right_to_left(rtl->source, std::move(rtl->dispatch));
    } else if (std::holds_alternative<ShutdownRequested>(message)) {
        co_await do_shutdown();
    } else if (auto* received = std::get_if<McpConnectionReceived>(&message)) {
        on_mcp_connection_received(std::move(*received));
    } else if (auto* established = std::get_if<McpConnectionEstablished>(&message)) {
        ACPP_LOG_DEBUG("MCP bridge connection established: " + established->connection_id);
    } else if (auto* outbound = std::get_if<McpClientToServer>(&message)) {
        on_mcp_client_to_server(std::move(*outbound));
    } else if (auto* disconnected = std::get_if<McpConnectionDisconnected>(&message)) {
        on_mcp_connection_disconnected(std::move(*disconnected));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Pumps
// ═══════════════════════════════════════════════════════════════════════════

void Conductor::start_pump(ConnectionPtr connection, SourceIndex source) {
    asio::co_spawn(strand_, pump(std::move(connection), source),
        [this, label = to_string(source)](std::exception_ptr error) {
            if (!error) {
                return;
            }
            log_on_exception(config_.name + " pump for " + label)(error);
            asio::co_spawn(strand_, do_shutdown(), asio::detached);
        });
}

asio::awaitable<void> Conductor::pump(ConnectionPtr connection, SourceIndex source) {
    for (;;) {
        auto message = co_await connection->async_receive();
        if (!message) {
            ACPP_LOG_DEBUG(std::format("{}: {} ended: {}", config_.name, to_string(source), message.error().message));
            break;
        }
        if (is_current(connection, source) == false) {
            ACPP_LOG_WARN(std::format("{}: ignoring message from abandoned {}", config_.name, to_string(source)));
            continue;
        }
        on_inbound(connection, source, std::move(*message));
    }
    co_await do_shutdown();
}

bool Conductor::is_current(const ConnectionPtr& connection, SourceIndex source) const {
    switch (source.kind) {
        case SourceIndex::Kind::Client:
            return connection == client_;
        case SourceIndex::Kind::Proxy:
            return source.index < proxies_.size() && proxies_[source.index] == connection;
        case SourceIndex::Kind::Successor:
            return connection == agent_;
    }
    return false;
}

void Conductor::enqueue(ConductorMessage message) {
    if (queue_.push(std::move(message)) == false) {
        ACPP_LOG_DEBUG(config_.name + ": queue closed, message dropped");
    }
}

void Conductor::on_inbound(const ConnectionPtr& connection, SourceIndex source, Json message) {
    auto parsed = parse_message(message);
    if (!parsed) {
        ACPP_LOG_WARN(std::format("{}: ignoring invalid message from {}: {}",
                                  config_.name, to_string(source), parsed.error().message));
        return;
    }

    const std::string peer = to_string(source);
    std::weak_ptr<IConnection> weak = connection;
    Dispatch dispatch = to_dispatch(std::move(*parsed), [&](const JsonRpcId& id) {
        return make_connection_responder(weak, id, peer);
    });
    ACPP_LOG_TRACE(std::format("{}: {} from {}", config_.name, describe(dispatch), peer));

    if (source.is_client()) {
        if (std::holds_alternative<ResponseDispatch>(dispatch)) {
            enqueue(RightToLeft{source, std::move(dispatch)});
        } else {
            enqueue(LeftToRight{0, std::move(dispatch)});
        }
        return;
    }

    if (source.is_proxy()) {
        const std::size_t successor_index = source.index + 1;

        if (auto* request = std::get_if<RequestDispatch>(&dispatch);
            request != nullptr && request->method == methods::kSuccessorRequest) {
            auto inner = unwrap_successor_payload(request->params);
            if (!inner) {
                request->responder.respond_with_error(JsonRpcError::invalid_params(inner.error().message));
                return;
            }
            enqueue(LeftToRight{successor_index, RequestDispatch{
                request->id, std::move(inner->method), std::move(inner->params), request->responder}});
            return;
        }

        if (auto* notification = std::get_if<NotificationDispatch>(&dispatch);
            notification != nullptr && notification->method == methods::kSuccessorNotification) {
            auto inner = unwrap_successor_payload(notification->params);
            if (!inner) {
                ACPP_LOG_WARN(std::format("{}: malformed successor notification from {}: {}",
                                          config_.name, peer, inner.error().message));
                return;
            }
            enqueue(LeftToRight{successor_index, NotificationDispatch{
                std::move(inner->method), std::move(inner->params)}});
            return;
        }
    }

    enqueue(RightToLeft{source, std::move(dispatch)});
}

// ═══════════════════════════════════════════════════════════════════════════
// Routing
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Conductor::route_left_to_right(std::size_t target_index, Dispatch dispatch) {
    if (auto* response = std::get_if<ResponseDispatch>(&dispatch)) {
        correlate(std::move(*response));
        co_return;
    }

    auto* request = std::get_if<RequestDispatch>(&dispatch);
    if (request != nullptr && is_initialize_method(request->method)) {
        if (target_index == 0) {
            co_await handle_initialize(std::move(*request));
            co_return;
        }
        if (state_ == ConductorState::Running) {
            forward_initialize(target_index, std::move(*request));
            co_return;
        }
    }

    if (state_ != ConductorState::Running) {
        reject_not_running(dispatch);
        co_return;
    }

    auto target = component_at(target_index);
    if (!target) {
        if (request != nullptr) {
            request->responder.respond_with_error(JsonRpcError::internal_error(
                std::format("No component at index {}", target_index)));
        } else {
            ACPP_LOG_WARN(std::format("{}: dropping {} for missing component {}",
                                      config_.name, describe(dispatch), target_index));
        }
        co_return;
    }

    if (request != nullptr && target_index == proxies_.size() && should_bridge(*request)) {
        if (attach_bridge_session(*request) == false) {
            co_return;
        }
    }

    forward_plain(target, std::move(dispatch), predecessor_of(target_index));
}

void Conductor::route_right_to_left(SourceIndex source, Dispatch dispatch) {
    if (auto* response = std::get_if<ResponseDispatch>(&dispatch)) {
        correlate(std::move(*response));
        return;
    }

    if (state_ != ConductorState::Running) {
        reject_not_running(dispatch);
        return;
    }

    switch (source.kind) {
        case SourceIndex::Kind::Client:
            ACPP_LOG_WARN(config_.name + ": " + describe(dispatch) + " from client has nowhere to go");
            return;

        case SourceIndex::Kind::Successor:
            if (proxies_.empty()) {
                forward_plain(client_, std::move(dispatch), source);
            } else {
                forward_wrapped(proxies_.size() - 1, std::move(dispatch));
            }
            return;

        case SourceIndex::Kind::Proxy:
            if (source.index == 0) {
                forward_plain(client_, std::move(dispatch), source);
            } else {
                forward_wrapped(source.index - 1, std::move(dispatch));
            }
            return;
    }
}

void Conductor::correlate(ResponseDispatch response) {
    const std::string key = response.id.to_string();
    auto it = pending_requests_.find(key);
    if (it == pending_requests_.end()) {
        ACPP_LOG_WARN(config_.name + ": no pending request for response id " + key);
        return;
    }

    PendingRequest pending = std::move(it->second);
    pending_requests_.erase(it);

    ACPP_LOG_TRACE(std::format("{}: response {} -> {} (id {})",
                               config_.name, key, to_string(pending.source), pending.original_id.to_string()));

    if (response.error.has_value()) {
        pending.responder.respond_with_error(std::move(*response.error));
    } else {
        pending.responder.respond(response.result.value_or(Json(nullptr)));
    }
}

void Conductor::forward_plain(const ConnectionPtr& target, Dispatch dispatch, SourceIndex origin) {
    if (auto* request = std::get_if<RequestDispatch>(&dispatch)) {
        send_request(target, std::move(request->method), std::move(request->params),
                     PendingRequest{std::move(request->id), std::move(request->responder), origin});
        return;
    }

    if (auto* notification = std::get_if<NotificationDispatch>(&dispatch)) {
        auto sent = target->send(JsonRpcNotification(std::move(notification->method),
                                                     std::move(notification->params)).to_json());
        if (!sent) {
            ACPP_LOG_WARN(config_.name + ": notification not delivered: " + sent.error().message);
        }
        return;
    }

    ACPP_LOG_WARN(config_.name + ": responses are correlated, not forwarded");
}

void Conductor::forward_wrapped(std::size_t proxy_index, Dispatch dispatch) {
    const auto& proxy = proxies_.at(proxy_index);

    if (auto* request = std::get_if<RequestDispatch>(&dispatch)) {
        send_request(proxy, std::string(methods::kSuccessorRequest),
                     wrap_successor_payload(request->method, request->params),
                     PendingRequest{std::move(request->id), std::move(request->responder),
                                    SourceIndex::proxy(proxy_index)});
        return;
    }

    if (auto* notification = std::get_if<NotificationDispatch>(&dispatch)) {
        auto sent = proxy->send(JsonRpcNotification(
            std::string(methods::kSuccessorNotification),
            wrap_successor_payload(notification->method, notification->params)).to_json());
        if (!sent) {
            ACPP_LOG_WARN(config_.name + ": wrapped notification not delivered: " + sent.error().message);
        }
        return;
    }

    ACPP_LOG_WARN(config_.name + ": responses are correlated, not forwarded");
}

void Conductor::send_request(
    const ConnectionPtr& target,
    std::string method,
    std::optional<Json> params,
    PendingRequest pending) {
    const JsonRpcId id = next_request_id();
    const std::string key = id.to_string();
    Responder responder = pending.responder;

    pending_requests_.insert_or_assign(key, std::move(pending));

    auto sent = target->send(JsonRpcRequest(method, id, std::move(params)).to_json());
    if (!sent) {
        pending_requests_.erase(key);
        responder.respond_with_error(JsonRpcError::internal_error(
            "Failed to forward " + method + ": " + sent.error().message));
    }
}

void Conductor::reject_not_running(const Dispatch& dispatch) {
    const ConductorState current = state_.load();
    if (const auto* request = std::get_if<RequestDispatch>(&dispatch)) {
        if (current == ConductorState::Shutdown) {
            request->responder.respond_with_error(JsonRpcError::internal_error("Conductor is shut down"));
        } else {
            request->responder.respond_with_error(JsonRpcError::invalid_request(
                std::format("Conductor is {}; send initialize first", to_string(current))));
        }
        return;
    }
    ACPP_LOG_WARN(std::format("{}: dropping {} while {}", config_.name, describe(dispatch), to_string(current)));
}

Conductor::ConnectionPtr Conductor::component_at(std::size_t target_index) const {
    if (target_index < proxies_.size()) {
        return proxies_[target_index];
    }
    if (target_index == proxies_.size()) {
        return agent_;
    }
    return nullptr;
}

SourceIndex Conductor::predecessor_of(std::size_t target_index) const {
    return target_index == 0 ? SourceIndex::client() : SourceIndex::proxy(target_index - 1);
}

JsonRpcId Conductor::next_request_id() {
    return JsonRpcId::integer(next_request_id_++);
}

// ═══════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Conductor::handle_initialize(RequestDispatch request) {
    if (state_ != ConductorState::Uninitialized) {
        request.responder.respond_with_error(JsonRpcError::invalid_request(
            std::format("Conductor is already {}", to_string(state_.load()))));
        co_return;
    }

    state_ = ConductorState::Initializing;
    ACPP_LOG_INFO(config_.name + ": initializing components");

    auto instantiated = co_await instantiate_components(InitializeRequest{request.method, request.params});
    if (!instantiated) {
        if (state_ == ConductorState::Shutdown) {
            request.responder.respond_with_error(JsonRpcError::internal_error(
                "Conductor shut down during initialization"));
            co_return;
        }
        abandon_components();
        state_ = ConductorState::Uninitialized;
        ACPP_LOG_ERROR(config_.name + ": initialization failed: " + instantiated.error().message);
        request.responder.respond_with_error(JsonRpcError::internal_error(
            "Failed to initialize: " + instantiated.error().message));
        co_return;
    }

    state_ = ConductorState::Running;
    ACPP_LOG_INFO(std::format("{}: running with {} prox{}", config_.name,
                              proxies_.size(), proxies_.size() == 1 ? "y" : "ies"));

    forward_initialize(0, std::move(request));
}

asio::awaitable<ConductorResult<void>> Conductor::instantiate_components(InitializeRequest request) {
    if (!config_.instantiator) {
        co_return tl::unexpected(ConductorError::instantiation_failed("No instantiator configured"));
    }

    ConductorResult<InstantiatedComponents> components;
    try {
        components = co_await config_.instantiator->async_instantiate(std::move(request));
    } catch (const std::exception& e) {
        co_return tl::unexpected(ConductorError::instantiation_failed(e.what()));
    }
    if (!components) {
        co_return tl::unexpected(components.error());
    }
    if (!components->agent) {
        co_return tl::unexpected(ConductorError::instantiation_failed("Instantiator returned no agent"));
    }

    for (std::size_t i = 0; i < components->proxies.size(); ++i) {
        const auto& connector = components->proxies[i];
        if (!connector) {
            co_return tl::unexpected(ConductorError::instantiation_failed(
                std::format("Instantiator returned no connector for proxy {}", i)));
        }
        auto connected = co_await connect_component(*connector, std::format("proxy {}", i));
        if (!connected) {
            co_return tl::unexpected(connected.error());
        }
        ConnectionPtr connection = std::move(*connected);
        if (state_ == ConductorState::Shutdown) {
            co_await connection->async_close();
            co_return tl::unexpected(ConductorError::shut_down());
        }
        proxies_.push_back(connection);
        start_pump(std::move(connection), SourceIndex::proxy(i));
    }

    auto connected = co_await connect_component(*components->agent, "agent");
    if (!connected) {
        co_return tl::unexpected(connected.error());
    }
    ConnectionPtr connection = std::move(*connected);
    if (state_ == ConductorState::Shutdown) {
        co_await connection->async_close();
        co_return tl::unexpected(ConductorError::shut_down());
    }
    agent_ = connection;
    start_pump(std::move(connection), SourceIndex::successor());

    co_return ConductorResult<void>{};
}

asio::awaitable<ConductorResult<Conductor::ConnectionPtr>>
Conductor::connect_component(IConnector& connector, std::string label) {
    TransportResult<std::unique_ptr<IConnection>> connected;
    try {
        connected = co_await connector.async_connect(strand_);
    } catch (const std::exception& e) {
        co_return tl::unexpected(ConductorError::connection_failed(label, TransportError::network(e.what())));
    }
    if (!connected) {
        co_return tl::unexpected(ConductorError::connection_failed(label, connected.error()));
    }
    co_return ConnectionPtr(std::move(*connected));
}

void Conductor::forward_initialize(std::size_t target_index, RequestDispatch request) {
    auto target = component_at(target_index);
    if (!target) {
        request.responder.respond_with_error(JsonRpcError::internal_error(
            std::format("No component at index {}", target_index)));
        return;
    }

    const Responder upstream = request.responder;

    if (target_index == proxies_.size()) {
        // The agent never sees the proxy marker
        request.params = without_proxy_marker(request.params);
        request.responder = Responder(
            [this, upstream](Json result) {
                agent_supports_mcp_transport_ = mcp_acp_transport_capability(result).value_or(false);
                upstream.respond(std::move(result));
            },
            [upstream](JsonRpcError error) { upstream.respond_with_error(std::move(error)); });
    } else {
        request.params = with_proxy_marker(request.params);
        const bool first_proxy = (target_index == 0);
        request.responder = Responder(
            [this, upstream, first_proxy](Json result) {
                if (has_proxy_marker(result) == false) {
                    upstream.respond_with_error(JsonRpcError::invalid_request("proxy capability not accepted"));
                    return;
                }
                if (first_proxy) {
                    if (auto supported = mcp_acp_transport_capability(result)) {
                        agent_supports_mcp_transport_ = *supported;
                    }
                }
                upstream.respond(without_proxy_marker(std::move(result)));
            },
            [upstream](JsonRpcError error) { upstream.respond_with_error(std::move(error)); });
    }

    forward_plain(target, Dispatch{std::move(request)}, predecessor_of(target_index));
}

void Conductor::abandon_components() {
    // Connected components stay open until shutdown; they no longer route
    for (auto& proxy : proxies_) {
        abandoned_.push_back(std::move(proxy));
    }
    proxies_.clear();
    if (agent_) {
        abandoned_.push_back(std::move(agent_));
        agent_.reset();
    }
    agent_supports_mcp_transport_ = false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Bridge
// ═══════════════════════════════════════════════════════════════════════════

bool Conductor::should_bridge(const RequestDispatch& request) const {
    return config_.mcp_bridge_mode == McpBridgeMode::Http
        && config_.mcp_bridge != nullptr
        && agent_supports_mcp_transport_ == false
        && request.method == methods::kSessionNew
        && references_acp_servers(request.params);
}

bool Conductor::attach_bridge_session(RequestDispatch& request) {
    auto bridge = config_.mcp_bridge;
    const std::string session_key = generate_uuid();

    auto rewritten = bridge->prepare_session(session_key, *request.params);
    if (!rewritten) {
        request.responder.respond_with_error(JsonRpcError::internal_error(
            "MCP bridge could not prepare session: " + rewritten.error().message));
        return false;
    }
    request.params = std::move(*rewritten);

    const Responder upstream = request.responder;
    request.responder = Responder(
        [bridge, session_key, upstream](Json result) {
            const auto session_id = result.is_object() ? result.find("sessionId") : result.end();
            if (session_id != result.end() && session_id->is_string()) {
                bridge->complete_session(session_key, session_id->get<std::string>());
            } else {
                ACPP_LOG_WARN("session/new result has no sessionId; releasing bridge session " + session_key);
                bridge->cancel_session(session_key);
            }
            upstream.respond(std::move(result));
        },
        [bridge, session_key, upstream](JsonRpcError error) {
            bridge->cancel_session(session_key);
            upstream.respond_with_error(std::move(error));
        });

    ACPP_LOG_DEBUG(config_.name + ": session/new routed through MCP bridge session " + session_key);
    return true;
}

void Conductor::on_mcp_connection_received(McpConnectionReceived event) {
    if (state_ != ConductorState::Running) {
        ACPP_LOG_WARN(config_.name + ": MCP connection before conductor is running; dropping " + event.connection_id);
        if (config_.mcp_bridge) {
            config_.mcp_bridge->connection_dropped(event.connection_id);
        }
        return;
    }

    const std::string connection_id = event.connection_id;
    bridge_connections_[connection_id] = event.acp_url;

    Json params = {{"connectionId", connection_id}, {"acp_url", event.acp_url}};
    RequestDispatch request{
        JsonRpcId::string(connection_id),
        std::string(methods::kMcpConnect),
        std::move(params),
        Responder(
            [this, connection_id](Json /*result*/) {
                enqueue(McpConnectionEstablished{connection_id});
            },
            [this, connection_id](JsonRpcError error) {
                ACPP_LOG_WARN(std::format("{}: MCP connect {} refused: {}", config_.name, connection_id, error.message));
                bridge_connections_.erase(connection_id);
                if (config_.mcp_bridge) {
                    config_.mcp_bridge->connection_dropped(connection_id);
                }
            })};

    route_right_to_left(SourceIndex::successor(), Dispatch{std::move(request)});
}

void Conductor::on_mcp_client_to_server(McpClientToServer event) {
    if (bridge_connections_.contains(event.connection_id) == false) {
        if (auto* request = std::get_if<RequestDispatch>(&event.dispatch)) {
            request->responder.respond_with_error(JsonRpcError::invalid_params(
                "Unknown MCP connection: " + event.connection_id));
        } else {
            ACPP_LOG_WARN(config_.name + ": message for unknown MCP connection " + event.connection_id);
        }
        return;
    }

    if (auto* request = std::get_if<RequestDispatch>(&event.dispatch)) {
        route_right_to_left(SourceIndex::successor(), Dispatch{RequestDispatch{
            request->id,
            std::string(methods::kMcpMessage),
            mcp_message_payload(event.connection_id, request->method, request->params),
            request->responder}});
    } else if (auto* notification = std::get_if<NotificationDispatch>(&event.dispatch)) {
        route_right_to_left(SourceIndex::successor(), Dispatch{NotificationDispatch{
            std::string(methods::kMcpMessage),
            mcp_message_payload(event.connection_id, notification->method, notification->params)}});
    } else {
        ACPP_LOG_WARN(config_.name + ": MCP clients do not send responses through the bridge");
    }
}

void Conductor::on_mcp_connection_disconnected(McpConnectionDisconnected event) {
    if (config_.mcp_bridge) {
        config_.mcp_bridge->connection_dropped(event.connection_id);
    }
    if (bridge_connections_.erase(event.connection_id) == 0) {
        ACPP_LOG_DEBUG(config_.name + ": disconnect for unknown MCP connection " + event.connection_id);
        return;
    }

    route_right_to_left(SourceIndex::successor(), Dispatch{NotificationDispatch{
        std::string(methods::kMcpDisconnect),
        Json{{"connectionId", event.connection_id}}}});
}

}  // namespace acpp
