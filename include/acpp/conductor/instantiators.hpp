#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Instantiators
// ═══════════════════════════════════════════════════════════════════════════
// Every instantiator is lazy: nothing is spawned until the conductor
// receives the client's initialize request.
//
//   from_connectors(agent, proxies)   pre-built connectors (tests, embedding)
//   static_instantiator({proxies, agent})
//   from_commands({"proxy-a", "agent --flag"})   last entry is the agent
//   dynamic_instantiator(factory)     decide per initialize request

#include "acpp/conductor/types.hpp"
#include "acpp/connection/stdio_connector.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace acpp {

/// A whole command line ("agent --model fast") or an explicit config
using CommandSpec = std::variant<std::string, StdioConnectorConfig>;

struct StaticInstantiatorConfig {
    std::vector<CommandSpec> proxies;
    CommandSpec agent;
};

using DynamicInstantiatorFactory =
    std::function<asio::awaitable<ConductorResult<InstantiatedComponents>>(InitializeRequest)>;

[[nodiscard]] std::shared_ptr<IInstantiator> from_connectors(
    std::shared_ptr<IConnector> agent,
    std::vector<std::shared_ptr<IConnector>> proxies = {});

[[nodiscard]] std::shared_ptr<IInstantiator> static_instantiator(StaticInstantiatorConfig config);

/// Throws std::invalid_argument when commands is empty
[[nodiscard]] std::shared_ptr<IInstantiator> from_commands(std::vector<CommandSpec> commands);

/// The factory must stay callable for the instantiator's lifetime
[[nodiscard]] std::shared_ptr<IInstantiator> dynamic_instantiator(DynamicInstantiatorFactory factory);

/// Split on spaces and tabs. Single or double quotes group characters and
/// are removed; there are no escape sequences.
[[nodiscard]] std::vector<std::string> split_command_line(std::string_view command_line);

[[nodiscard]] StdioConnectorConfig to_connector_config(const CommandSpec& spec);

}  // namespace acpp
