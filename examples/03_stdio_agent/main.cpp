// Example 03: Agent as a Child Process
//
// Spawns a real agent command over stdio and sends it an initialize
// request through the conductor.
//
// Usage:
//   03_stdio_agent <agent-command> [args...]
//   03_stdio_agent npx -y @zed-industries/claude-code-acp

#include <acpp/conductor/conductor.hpp>
#include <acpp/conductor/instantiators.hpp>
#include <acpp/connection/channel_connection.hpp>
#include <acpp/log/spdlog_logger.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace acpp;

asio::awaitable<int> run_client(Conductor& conductor, std::unique_ptr<ChannelConnection> client) {
    auto sent = client->send(JsonRpcRequest("initialize", 1, Json{
        {"protocolVersion", 1},
        {"clientCapabilities", Json::object()}}).to_json());
    if (!sent) {
        std::cerr << "ERROR: " << sent.error().message << "\n";
        co_return 1;
    }

    // Agents may take a while to start (npx downloads). Shutting the
    // conductor down closes our channel, which ends the wait below.
    asio::steady_timer timeout(co_await asio::this_coro::executor, std::chrono::seconds(60));
    timeout.async_wait([&conductor](const asio::error_code& ec) {
        if (!ec) {
            conductor.request_shutdown();
        }
    });

    int exit_code = 0;
    auto reply = co_await client->async_receive();
    timeout.cancel();
    if (!reply) {
        std::cerr << "ERROR: agent did not answer initialize: " << reply.error().message << "\n";
        exit_code = 1;
    } else {
        std::cout << "Agent answered:\n" << reply->dump(2) << "\n";
    }

    co_await conductor.shutdown();
    co_return exit_code;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <agent-command> [args...]\n";
        return 1;
    }

    try {
        set_logger(make_spdlog_stderr_logger(LogLevel::Debug));

        StdioConnectorConfig agent;
        agent.command = argv[1];
        agent.args.assign(argv + 2, argv + argc);

        asio::io_context io;

        Conductor conductor(io.get_executor(), ConductorConfig{
            .name = "stdio-example",
            .instantiator = static_instantiator({.proxies = {}, .agent = agent}),
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
