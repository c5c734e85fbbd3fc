// Example 01: Pass-Through Conductor
//
// The smallest chain: no proxies, one agent running as a coroutine inside
// this process. The client end is an in-memory channel, so the whole
// exchange can be printed.

#include <acpp/conductor/conductor.hpp>
#include <acpp/conductor/instantiators.hpp>
#include <acpp/connection/channel_connection.hpp>
#include <acpp/log/spdlog_logger.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <iostream>
#include <memory>
#include <string>

using namespace acpp;

// Answers every request; initialize advertises no bridge support
asio::awaitable<void> echo_agent(std::shared_ptr<IConnection> connection) {
    for (;;) {
        auto message = co_await connection->async_receive();
        if (!message) {
            co_return;
        }

        auto request = JsonRpcRequest::from_json(*message);
        if (!request) {
            continue;
        }

        Json result;
        if (request->method() == "initialize") {
            result = {{"protocolVersion", 1}, {"capabilities", {{"mcp_acp_transport", false}}}};
        } else {
            result = {{"method", request->method()}, {"echo", request->params().value_or(Json::object())}};
        }

        auto sent = connection->send(JsonRpcResponse::success(request->id(), std::move(result)).to_json());
        if (!sent) {
            co_return;
        }
    }
}

asio::awaitable<int> run_client(Conductor& conductor, std::unique_ptr<ChannelConnection> client) {
    std::cout << "=== Pass-Through Conductor Example ===\n\n";

    int request_id = 0;
    auto call = [&](const std::string& method, Json params) -> asio::awaitable<TransportResult<Json>> {
        auto sent = client->send(JsonRpcRequest(method, ++request_id, std::move(params)).to_json());
        if (!sent) {
            co_return tl::unexpected(sent.error());
        }
        co_return co_await client->async_receive();
    };

    // 1. Handshake; the conductor spawns the agent now
    auto init = co_await call("initialize", {{"protocolVersion", 1}});
    if (!init) {
        std::cerr << "ERROR: " << init.error().message << "\n";
        co_return 1;
    }
    std::cout << "initialize  -> " << init->dump() << "\n";

    // 2. Ordinary traffic is forwarded unchanged
    auto session = co_await call("session/new", {{"cwd", "/tmp"}, {"mcpServers", Json::array()}});
    if (!session) {
        std::cerr << "ERROR: " << session.error().message << "\n";
        co_return 1;
    }
    std::cout << "session/new -> " << session->dump() << "\n\n";

    std::cout << "Shutting down...\n";
    co_await conductor.shutdown();
    std::cout << "Done!\n";
    co_return 0;
}

int main() {
    try {
        set_logger(make_spdlog_stderr_logger(LogLevel::Debug));

        asio::io_context io;

        Conductor conductor(io.get_executor(), ConductorConfig{
            .name = "pass-through",
            .instantiator = from_connectors(std::make_shared<InProcessConnector>(echo_agent, "echo agent")),
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
