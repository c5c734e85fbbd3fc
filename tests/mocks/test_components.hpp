#ifndef ACPP_TESTS_MOCK_TEST_COMPONENTS_HPP
#define ACPP_TESTS_MOCK_TEST_COMPONENTS_HPP

#include "acpp/conductor/conductor.hpp"
#include "acpp/conductor/instantiators.hpp"
#include "acpp/connection/channel_connection.hpp"
#include "acpp/protocol/acp_extensions.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace acpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// Driving the io_context
// ─────────────────────────────────────────────────────────────────────────────

/// Run handlers until done() holds. Returns false on timeout.
inline bool run_until(asio::io_context& io, const std::function<bool()>& done,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (done() == false) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (io.stopped()) {
            io.restart();
        }
        io.run_one_for(std::chrono::milliseconds(10));
    }
    return true;
}

/// Run until the io_context has no work left
inline void drain(asio::io_context& io, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    if (io.stopped()) {
        io.restart();
    }
    while (io.stopped() == false && std::chrono::steady_clock::now() < deadline) {
        io.run_one_for(std::chrono::milliseconds(10));
    }
}

/// Run an awaitable to completion; exceptions escape from the io_context
template <typename T>
std::optional<T> run_to_completion(asio::io_context& io, asio::awaitable<T> coro,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto result = std::make_shared<std::optional<T>>();
    asio::co_spawn(io, std::move(coro), [result](std::exception_ptr error, T value) {
        if (error) {
            std::rethrow_exception(error);
        }
        *result = std::move(value);
    });
    run_until(io, [&result] { return result->has_value(); }, timeout);
    return std::move(*result);
}

inline bool run_to_completion(asio::io_context& io, asio::awaitable<void> coro,
                              std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto finished = std::make_shared<bool>(false);
    asio::co_spawn(io, std::move(coro), [finished](std::exception_ptr error) {
        if (error) {
            std::rethrow_exception(error);
        }
        *finished = true;
    });
    return run_until(io, [&finished] { return *finished; }, timeout);
}

// ─────────────────────────────────────────────────────────────────────────────
// Message log shared by every scripted peer
// ─────────────────────────────────────────────────────────────────────────────

class MessageLog {
public:
    void record(Json message) { messages_.push_back(std::move(message)); }

    [[nodiscard]] const std::vector<Json>& all() const noexcept { return messages_; }
    [[nodiscard]] std::size_t size() const noexcept { return messages_.size(); }

    [[nodiscard]] std::vector<Json> with_method(std::string_view method) const {
        std::vector<Json> matches;
        for (const auto& message : messages_) {
            const auto it = message.find("method");
            if (it != message.end() && it->is_string() && it->get_ref<const std::string&>() == method) {
                matches.push_back(message);
            }
        }
        return matches;
    }

    /// First response (no method) carrying this id
    [[nodiscard]] std::optional<Json> response_for(const Json& id) const {
        for (const auto& message : messages_) {
            if (message.contains("method") == false && message.contains("id") && message["id"] == id) {
                return message;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::size_t count_responses() const {
        std::size_t count = 0;
        for (const auto& message : messages_) {
            if (message.contains("method") == false) {
                ++count;
            }
        }
        return count;
    }

private:
    std::vector<Json> messages_;
};

inline void send_or_throw(IConnection& connection, Json message) {
    auto sent = connection.send(std::move(message));
    if (!sent) {
        throw std::runtime_error("send failed: " + sent.error().message);
    }
}

inline JsonRpcId id_of(const Json& message) {
    const Json& id = message.at("id");
    if (id.is_string()) {
        return JsonRpcId::string(id.get<std::string>());
    }
    return JsonRpcId::integer(id.get<std::int64_t>());
}

// ─────────────────────────────────────────────────────────────────────────────
// TestPeer - the client end of a conductor
// ─────────────────────────────────────────────────────────────────────────────

class TestPeer {
public:
    explicit TestPeer(std::shared_ptr<IConnection> connection)
        : connection_(std::move(connection))
        , state_(std::make_shared<State>()) {}

    void start(asio::any_io_executor executor) {
        executor_ = executor;
        asio::co_spawn(executor, read_loop(connection_, state_), asio::detached);
    }

    /// Hang up; the other end sees end of stream
    void close() {
        asio::co_spawn(executor_, connection_->async_close(), asio::detached);
    }

    void request(std::int64_t id, const std::string& method, std::optional<Json> params = std::nullopt) {
        send_or_throw(*connection_, JsonRpcRequest(method, id, std::move(params)).to_json());
    }

    void notify(const std::string& method, std::optional<Json> params = std::nullopt) {
        send_or_throw(*connection_, JsonRpcNotification(method, std::move(params)).to_json());
    }

    void respond(const JsonRpcId& id, Json result) {
        send_or_throw(*connection_, JsonRpcResponse::success(id, std::move(result)).to_json());
    }

    void respond_error(const JsonRpcId& id, JsonRpcError error) {
        send_or_throw(*connection_, JsonRpcResponse::failure(id, std::move(error)).to_json());
    }

    void send_raw(Json message) { send_or_throw(*connection_, std::move(message)); }

    [[nodiscard]] const MessageLog& log() const noexcept { return state_->log; }
    [[nodiscard]] bool closed() const noexcept { return state_->closed; }
    [[nodiscard]] IConnection& connection() noexcept { return *connection_; }

private:
    struct State {
        MessageLog log;
        bool closed{false};
    };

    static asio::awaitable<void> read_loop(std::shared_ptr<IConnection> connection, std::shared_ptr<State> state) {
        for (;;) {
            auto message = co_await connection->async_receive();
            if (!message) {
                state->closed = true;
                co_return;
            }
            state->log.record(std::move(*message));
        }
    }

    std::shared_ptr<IConnection> connection_;
    std::shared_ptr<State> state_;
    asio::any_io_executor executor_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ScriptedAgent - answers requests from a method table
// ─────────────────────────────────────────────────────────────────────────────

class ScriptedAgent : public std::enable_shared_from_this<ScriptedAgent> {
public:
    using Handler = std::function<tl::expected<Json, JsonRpcError>(const std::optional<Json>& params)>;

    static std::shared_ptr<ScriptedAgent> create() {
        return std::shared_ptr<ScriptedAgent>(new ScriptedAgent());
    }

    void on(const std::string& method, Handler handler) { handlers_[method] = std::move(handler); }

    /// Requests for method are recorded but never answered
    void ignore(const std::string& method) { handlers_[method] = nullptr; }

    void advertise_mcp_transport(bool supported) {
        on("initialize", [supported](const std::optional<Json>&) -> tl::expected<Json, JsonRpcError> {
            return Json{{"protocolVersion", 1}, {"capabilities", {{"mcp_acp_transport", supported}}}};
        });
    }

    [[nodiscard]] std::shared_ptr<IConnector> connector() {
        auto self = shared_from_this();
        return std::make_shared<InProcessConnector>(
            [self](std::shared_ptr<IConnection> connection) { return serve(self, std::move(connection)); },
            "scripted agent");
    }

    void send(Json message) {
        if (!connection_) {
            throw std::runtime_error("agent is not connected");
        }
        send_or_throw(*connection_, std::move(message));
    }

    /// Hang up on the conductor
    void disconnect() {
        if (auto* channel = dynamic_cast<ChannelConnection*>(connection_.get())) {
            channel->close();
        }
    }

    [[nodiscard]] const MessageLog& log() const noexcept { return log_; }
    [[nodiscard]] int connect_count() const noexcept { return connect_count_; }
    [[nodiscard]] bool closed() const noexcept { return closed_; }

private:
    ScriptedAgent() {
        on("initialize", [](const std::optional<Json>&) -> tl::expected<Json, JsonRpcError> {
            return Json{{"protocolVersion", 1}, {"capabilities", Json::object()}};
        });
    }

    static asio::awaitable<void> serve(std::shared_ptr<ScriptedAgent> self, std::shared_ptr<IConnection> connection) {
        self->connection_ = connection;
        self->closed_ = false;
        ++self->connect_count_;

        for (;;) {
            auto message = co_await connection->async_receive();
            if (!message) {
                self->closed_ = true;
                co_return;
            }
            self->log_.record(*message);
            self->answer(*connection, *message);
        }
    }

    void answer(IConnection& connection, const Json& message) {
        auto request = JsonRpcRequest::from_json(message);
        if (!request) {
            return;
        }

        auto handler = handlers_.find(request->method());
        if (handler == handlers_.end()) {
            send_or_throw(connection, JsonRpcResponse::success(request->id(),
                Json{{"method", request->method()}, {"params", request->params().value_or(Json(nullptr))}}).to_json());
            return;
        }
        if (!handler->second) {
            return;
        }

        auto outcome = handler->second(request->params());
        if (outcome) {
            send_or_throw(connection, JsonRpcResponse::success(request->id(), std::move(*outcome)).to_json());
        } else {
            send_or_throw(connection, JsonRpcResponse::failure(request->id(), std::move(outcome.error())).to_json());
        }
    }

    std::map<std::string, Handler> handlers_;
    std::shared_ptr<IConnection> connection_;
    MessageLog log_;
    int connect_count_{0};
    bool closed_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// ForwardingProxy - passes everything to its successor and back
// ─────────────────────────────────────────────────────────────────────────────
// Requests from the left go out as _proxy/successor/request; wrapped
// messages from the right are unwrapped and sent to the left as plain
// messages. The proxy answers initialize with _meta.proxy unless told not to.

class ForwardingProxy : public std::enable_shared_from_this<ForwardingProxy> {
public:
    static std::shared_ptr<ForwardingProxy> create(bool accept_proxy_capability = true) {
        return std::shared_ptr<ForwardingProxy>(new ForwardingProxy(accept_proxy_capability));
    }

    [[nodiscard]] std::shared_ptr<IConnector> connector() {
        auto self = shared_from_this();
        return std::make_shared<InProcessConnector>(
            [self](std::shared_ptr<IConnection> connection) { return serve(self, std::move(connection)); },
            "forwarding proxy");
    }

    void send(Json message) {
        if (!connection_) {
            throw std::runtime_error("proxy is not connected");
        }
        send_or_throw(*connection_, std::move(message));
    }

    [[nodiscard]] const MessageLog& log() const noexcept { return log_; }
    [[nodiscard]] bool closed() const noexcept { return closed_; }

private:
    struct Pending {
        JsonRpcId upstream_id;
        std::string method;
    };

    explicit ForwardingProxy(bool accept_proxy_capability)
        : accept_proxy_capability_(accept_proxy_capability) {}

    static asio::awaitable<void> serve(std::shared_ptr<ForwardingProxy> self, std::shared_ptr<IConnection> connection) {
        self->connection_ = connection;
        for (;;) {
            auto message = co_await connection->async_receive();
            if (!message) {
                self->closed_ = true;
                co_return;
            }
            self->log_.record(*message);
            self->handle(*connection, *message);
        }
    }

    void handle(IConnection& connection, const Json& message) {
        auto parsed = parse_message(message);
        if (!parsed) {
            return;
        }

        if (auto* request = std::get_if<JsonRpcRequest>(&*parsed)) {
            const std::int64_t id = next_id_++;

            if (request->method() == methods::kSuccessorRequest) {
                // From the successor: deliver to our predecessor as a plain request
                auto inner = unwrap_successor_payload(request->params());
                if (!inner) {
                    return;
                }
                pending_.emplace(id, Pending{request->id(), inner->method});
                send_or_throw(connection, JsonRpcRequest(inner->method, id, inner->params).to_json());
            } else {
                pending_.emplace(id, Pending{request->id(), request->method()});
                send_or_throw(connection, JsonRpcRequest(
                    std::string(methods::kSuccessorRequest), id,
                    wrap_successor_payload(request->method(), without_proxy_marker(request->params()))).to_json());
            }
            return;
        }

        if (auto* notification = std::get_if<JsonRpcNotification>(&*parsed)) {
            if (notification->method() == methods::kSuccessorNotification) {
                auto inner = unwrap_successor_payload(notification->params());
                if (inner) {
                    send_or_throw(connection, JsonRpcNotification(inner->method, inner->params).to_json());
                }
            } else {
                send_or_throw(connection, JsonRpcNotification(
                    std::string(methods::kSuccessorNotification),
                    wrap_successor_payload(notification->method(), notification->params())).to_json());
            }
            return;
        }

        const auto& response = std::get<JsonRpcResponse>(*parsed);
        const auto* numeric = std::get_if<std::int64_t>(&response.id().value);
        auto it = numeric ? pending_.find(*numeric) : pending_.end();
        if (it == pending_.end()) {
            return;
        }
        Pending origin = std::move(it->second);
        pending_.erase(it);

        if (response.is_error()) {
            send_or_throw(connection, JsonRpcResponse::failure(origin.upstream_id, *response.error()).to_json());
            return;
        }
        Json result = response.result().value_or(Json(nullptr));
        if (is_initialize_method(origin.method) && accept_proxy_capability_) {
            result["_meta"]["proxy"] = true;
        }
        send_or_throw(connection, JsonRpcResponse::success(origin.upstream_id, std::move(result)).to_json());
    }

    bool accept_proxy_capability_;
    std::shared_ptr<IConnection> connection_;
    std::map<std::int64_t, Pending> pending_;
    std::int64_t next_id_{1};
    MessageLog log_;
    bool closed_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Connectors that misbehave
// ─────────────────────────────────────────────────────────────────────────────

class FailingConnector final : public IConnector {
public:
    asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
    async_connect(asio::any_io_executor /*executor*/) override {
        ++attempts;
        co_return tl::unexpected(TransportError::network("connection refused"));
    }

    int attempts{0};
};

class ThrowingConnector final : public IConnector {
public:
    asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
    async_connect(asio::any_io_executor /*executor*/) override {
        ++attempts;
        throw std::system_error(std::make_error_code(std::errc::bad_file_descriptor), "descriptor registration failed");
        co_return tl::unexpected(TransportError::network("unreachable"));
    }

    int attempts{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// ConductorHarness - a conductor with an in-memory client
// ─────────────────────────────────────────────────────────────────────────────

class ConductorHarness {
public:
    explicit ConductorHarness(ConductorConfig config)
        : conductor_(std::make_unique<Conductor>(io.get_executor(), std::move(config))) {}

    explicit ConductorHarness(std::shared_ptr<IInstantiator> instantiator)
        : ConductorHarness(ConductorConfig{.name = "test-conductor", .instantiator = std::move(instantiator)}) {}

    ~ConductorHarness() {
        shutdown();
        drain(io);
        conductor_.reset();
    }

    ConductorHarness(const ConductorHarness&) = delete;
    ConductorHarness& operator=(const ConductorHarness&) = delete;

    /// Connect the in-memory client and start the conductor's event loop
    void connect() {
        auto pair = make_channel_pair(io.get_executor());
        client_ = std::make_unique<TestPeer>(std::shared_ptr<IConnection>(std::move(pair.left)));
        client_->start(io.get_executor());

        auto done = connect_result_;
        asio::co_spawn(io,
            conductor_->connect(std::make_shared<PreconnectedConnector>(std::move(pair.right))),
            [done](std::exception_ptr error, ConductorResult<void> result) {
                if (error) {
                    std::rethrow_exception(error);
                }
                *done = std::move(result);
            });
    }

    /// Send initialize from the client and wait for its response
    std::optional<Json> initialize(std::int64_t id = 1, Json params = Json{{"protocolVersion", 1}}) {
        client().request(id, "initialize", std::move(params));
        return await_response(id);
    }

    std::optional<Json> await_response(std::int64_t id) {
        const Json key(id);
        run_until([&] { return client().log().response_for(key).has_value(); });
        return client().log().response_for(key);
    }

    void shutdown() {
        if (conductor_) {
            run_to_completion(io, conductor_->shutdown());
        }
    }

    bool run_until(const std::function<bool()>& done,
                   std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        return testing::run_until(io, done, timeout);
    }

    /// Let queued work settle without waiting for a condition
    void settle(std::chrono::milliseconds duration = std::chrono::milliseconds(50)) {
        testing::run_until(io, [] { return false; }, duration);
    }

    [[nodiscard]] Conductor& conductor() { return *conductor_; }
    [[nodiscard]] TestPeer& client() { return *client_; }
    [[nodiscard]] const std::optional<ConductorResult<void>>& connect_result() const { return *connect_result_; }

    asio::io_context io;

private:
    std::unique_ptr<Conductor> conductor_;
    std::unique_ptr<TestPeer> client_;
    std::shared_ptr<std::optional<ConductorResult<void>>> connect_result_ =
        std::make_shared<std::optional<ConductorResult<void>>>();
};

}  // namespace acpp::testing

#endif  // ACPP_TESTS_MOCK_TEST_COMPONENTS_HPP
