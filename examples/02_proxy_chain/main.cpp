// Example 02: Proxy Chain
//
// client -> tagging proxy -> agent, all in one process.
//
// The proxy accepts the proxy capability during initialize, reaches the
// agent through _proxy/successor/request, and tags every session/prompt
// result on the way back. It never talks to the agent directly.

#include <acpp/conductor/conductor.hpp>
#include <acpp/conductor/instantiators.hpp>
#include <acpp/connection/channel_connection.hpp>
#include <acpp/log/spdlog_logger.hpp>
#include <acpp/protocol/acp_extensions.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace acpp;

asio::awaitable<void> prompt_agent(std::shared_ptr<IConnection> connection) {
    for (;;) {
        auto message = co_await connection->async_receive();
        if (!message) {
            co_return;
        }
        auto request = JsonRpcRequest::from_json(*message);
        if (!request) {
            continue;
        }

        Json result = Json::object();
        if (request->method() == "initialize") {
            result = {{"protocolVersion", 1}, {"capabilities", Json::object()}};
        } else if (request->method() == "session/prompt") {
            // Progress travels back through the proxy as a wrapped notification
            auto update = connection->send(JsonRpcNotification("session/update", Json{{"text", "thinking..."}}).to_json());
            if (!update) {
                co_return;
            }
            result = {{"stopReason", "end_turn"}};
        }

        if (!connection->send(JsonRpcResponse::success(request->id(), std::move(result)).to_json())) {
            co_return;
        }
    }
}

asio::awaitable<void> tagging_proxy(std::shared_ptr<IConnection> connection) {
    struct Pending {
        JsonRpcId upstream_id;
        std::string method;
    };
    std::map<std::int64_t, Pending> pending;
    std::int64_t next_id = 1;

    for (;;) {
        auto message = co_await connection->async_receive();
        if (!message) {
            co_return;
        }
        auto parsed = parse_message(*message);
        if (!parsed) {
            continue;
        }

        TransportResult<void> sent;
        if (auto* request = std::get_if<JsonRpcRequest>(&*parsed)) {
            // From the client side: forward to our successor
            const std::int64_t id = next_id++;
            pending.emplace(id, Pending{request->id(), request->method()});
            sent = connection->send(JsonRpcRequest(
                std::string(methods::kSuccessorRequest), id,
                wrap_successor_payload(request->method(), without_proxy_marker(request->params()))).to_json());

        } else if (auto* notification = std::get_if<JsonRpcNotification>(&*parsed)) {
            // From the agent: unwrap and pass toward the client
            auto inner = unwrap_successor_payload(notification->params());
            if (!inner) {
                continue;
            }
            Json params = inner->params.value_or(Json::object());
            params["via"] = "tagging-proxy";
            sent = connection->send(JsonRpcNotification(inner->method, std::move(params)).to_json());

        } else {
            const auto& response = std::get<JsonRpcResponse>(*parsed);
            const auto* numeric = std::get_if<std::int64_t>(&response.id().value);
            auto it = numeric ? pending.find(*numeric) : pending.end();
            if (it == pending.end()) {
                continue;
            }
            Pending origin = std::move(it->second);
            pending.erase(it);

            if (response.is_error()) {
                sent = connection->send(JsonRpcResponse::failure(origin.upstream_id, *response.error()).to_json());
            } else {
                Json result = response.result().value_or(Json::object());
                if (origin.method == "initialize") {
                    result["_meta"]["proxy"] = true;
                } else if (origin.method == "session/prompt") {
                    result["taggedBy"] = "tagging-proxy";
                }
                sent = connection->send(JsonRpcResponse::success(origin.upstream_id, std::move(result)).to_json());
            }
        }

        if (!sent) {
            co_return;
        }
    }
}

asio::awaitable<int> run_client(Conductor& conductor, std::unique_ptr<ChannelConnection> client) {
    std::cout << "=== Proxy Chain Example ===\n\n";

    auto exchange = [&](JsonRpcRequest request) -> asio::awaitable<bool> {
        if (!client->send(request.to_json())) {
            co_return false;
        }
        // Print everything up to the matching response
        for (;;) {
            auto reply = co_await client->async_receive();
            if (!reply) {
                std::cerr << "ERROR: " << reply.error().message << "\n";
                co_return false;
            }
            std::cout << "  <- " << reply->dump() << "\n";
            if (reply->contains("method") == false) {
                co_return true;
            }
        }
    };

    std::cout << "initialize\n";
    if (co_await exchange(JsonRpcRequest("initialize", 1, Json{{"protocolVersion", 1}})) == false) {
        co_return 1;
    }

    std::cout << "session/prompt\n";
    if (co_await exchange(JsonRpcRequest("session/prompt", 2, Json{{"prompt", "hello"}})) == false) {
        co_return 1;
    }

    std::cout << "\nShutting down...\n";
    co_await conductor.shutdown();
    std::cout << "Done!\n";
    co_return 0;
}

int main() {
    try {
        set_logger(make_spdlog_stderr_logger(LogLevel::Info));

        asio::io_context io;

        Conductor conductor(io.get_executor(), ConductorConfig{
            .name = "proxy-chain",
            .instantiator = from_connectors(
                std::make_shared<InProcessConnector>(prompt_agent, "prompt agent"),
                {std::make_shared<InProcessConnector>(tagging_proxy, "tagging proxy")}),
        });

        auto [client, conductor_side] = make_channel_pair(io.get_executor());

        asio::co_spawn(io,
            conductor.connect(std::make_shared<PreconnectedConnector>(std::move(conductor_side))),
            [](std::exception_ptr, ConductorResult<void> result) {
                if (!result) {
                    std::cerr << "Conductor failed: " << result.error().message << "\n";
                }
            });

        int exit_code = 0;
        asio::co_spawn(io,
            [&conductor, &exit_code, client = std::move(client)]() mutable -> asio::awaitable<void> {
                exit_code = co_await run_client(conductor, std::move(client));
            },
            asio::detached);

        io.run();

        set_logger(nullptr);
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
