// ─────────────────────────────────────────────────────────────────────────────
// acpp-conductor - run a proxy chain behind one stdio endpoint
// ─────────────────────────────────────────────────────────────────────────────
// The editor (or any ACP client) talks to this process over stdin/stdout.
// Proxies and the agent are spawned on the client's initialize request.
//
// Usage:
//   # Positional form: every command but the last is a proxy
//   acpp-conductor "sparkle-proxy --verbose" "my-agent --model fast"
//
//   # Explicit form
//   acpp-conductor --proxy "context-proxy" --proxy "sparkle-proxy" --agent "my-agent"
//
//   # Logging goes to stderr (and optionally a file), never stdout
//   ACPP_LOG_LEVEL=debug acpp-conductor --log-file /tmp/conductor.log proxy agent

#include <cxxopts.hpp>

#include "acpp/async/spawn.hpp"
#include "acpp/conductor/conductor.hpp"
#include "acpp/conductor/instantiators.hpp"
#include "acpp/connection/stdio_connector.hpp"
#include "acpp/log/spdlog_logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifndef ACPP_VERSION
#define ACPP_VERSION "0.0.0"
#endif

using namespace acpp;

namespace {

void print_error(const std::string& message) {
    std::cerr << "acpp-conductor: " << message << "\n";
}

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

// --log-level wins over ACPP_LOG_LEVEL; info when neither is set
std::optional<LogLevel> resolve_log_level(const cxxopts::ParseResult& result) {
    std::string name = "info";
    if (result.count("log-level")) {
        name = result["log-level"].as<std::string>();
    } else if (auto from_env = get_env("ACPP_LOG_LEVEL")) {
        name = *from_env;
    }
    auto level = parse_log_level(name);
    if (!level) {
        print_error("Unknown log level '" + name + "' (expected trace, debug, info, warn, error, off)");
    }
    return level;
}

// Proxies first, agent last
std::optional<std::vector<CommandSpec>> resolve_commands(const cxxopts::ParseResult& result) {
    std::vector<std::string> positional;
    if (result.count("commands")) {
        positional = result["commands"].as<std::vector<std::string>>();
    }
    const bool explicit_form = result.count("proxy") > 0 || result.count("agent") > 0;

    if (explicit_form && !positional.empty()) {
        print_error("Positional commands cannot be combined with --proxy/--agent");
        return std::nullopt;
    }

    std::vector<CommandSpec> commands;
    if (explicit_form) {
        if (result.count("agent") == 0) {
            print_error("--proxy requires --agent");
            return std::nullopt;
        }
        if (result.count("proxy")) {
            for (auto& proxy : result["proxy"].as<std::vector<std::string>>()) {
                commands.emplace_back(std::move(proxy));
            }
        }
        commands.emplace_back(result["agent"].as<std::string>());
    } else {
        for (auto& command : positional) {
            commands.emplace_back(std::move(command));
        }
    }

    if (commands.empty()) {
        print_error("No agent given");
        return std::nullopt;
    }
    for (const auto& command : commands) {
        if (to_connector_config(command).command.empty()) {
            print_error("Empty component command");
            return std::nullopt;
        }
    }
    return commands;
}

std::unique_ptr<SpdlogLogger> make_logger(const cxxopts::ParseResult& result, LogLevel level) {
    if (result.count("log-file")) {
        return make_spdlog_stderr_file_logger(result["log-file"].as<std::string>(), level);
    }
    return make_spdlog_stderr_logger(level);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("acpp-conductor", "Route an ACP client through a chain of proxies to an agent");
    options.positional_help("[--] <proxy-cmd>... <agent-cmd>");

    options.add_options()
        ("p,proxy", "Proxy command, client side first (can be repeated)", cxxopts::value<std::vector<std::string>>())
        ("a,agent", "Agent command", cxxopts::value<std::string>())
        ("n,name", "Conductor name used in log lines", cxxopts::value<std::string>()->default_value("conductor"))
        ("l,log-level", "trace, debug, info, warn, error or off (or use ACPP_LOG_LEVEL env var)", cxxopts::value<std::string>())
        ("log-file", "Also write the log to this file", cxxopts::value<std::string>())
        ("commands", "Component commands", cxxopts::value<std::vector<std::string>>())
        ("version", "Print version")
        ("h,help", "Print usage");

    options.parse_positional({"commands"});

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    acpp-conductor 'my-agent --model fast'\n";
            std::cout << "    acpp-conductor 'sparkle-proxy' 'my-agent'\n";
            std::cout << "    acpp-conductor --proxy 'context-proxy' --proxy 'sparkle-proxy' --agent 'my-agent'\n";
            return 0;
        }

        if (result.count("version")) {
            std::cout << "acpp-conductor " << ACPP_VERSION << "\n";
            return 0;
        }

        auto level = resolve_log_level(result);
        if (!level) {
            return 1;
        }

        auto commands = resolve_commands(result);
        if (!commands) {
            std::cerr << "\n" << options.help() << "\n";
            return 1;
        }

        try {
            set_logger(make_logger(result, *level));
        } catch (const spdlog::spdlog_ex& e) {
            print_error(std::string("Cannot open log: ") + e.what());
            return 1;
        }

        // stdout may be closed by the client at any time
        std::signal(SIGPIPE, SIG_IGN);

        asio::io_context io;

        Conductor conductor(io.get_executor(), ConductorConfig{
            .name = result["name"].as<std::string>(),
            .instantiator = from_commands(std::move(*commands)),
        });

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&conductor](const asio::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            ACPP_LOG_INFO("Received signal " + std::to_string(signal_number));
            conductor.request_shutdown();
        });

        int exit_code = 0;
        asio::co_spawn(io,
            [&]() -> asio::awaitable<void> {
                auto run = co_await conductor.connect(std::make_shared<StdioServerConnector>());
                if (!run) {
                    ACPP_LOG_ERROR("Conductor failed: " + run.error().message);
                    exit_code = 1;
                }
                signals.cancel();
            },
            log_on_exception("conductor"));

        io.run();

        get_logger().info("Exiting with code " + std::to_string(exit_code));
        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
