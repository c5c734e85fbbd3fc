#include "acpp/conductor/instantiators.hpp"

#include <stdexcept>

namespace acpp {

namespace {

class FixedInstantiator final : public IInstantiator {
public:
    explicit FixedInstantiator(InstantiatedComponents components)
        : components_(std::move(components)) {}

    asio::awaitable<ConductorResult<InstantiatedComponents>> async_instantiate(InitializeRequest /*request*/) override {
        if (!components_.agent) {
            co_return tl::unexpected(ConductorError::instantiation_failed("No agent connector configured"));
        }
        co_return components_;
    }

private:
    InstantiatedComponents components_;
};

class CommandInstantiator final : public IInstantiator {
public:
    explicit CommandInstantiator(StaticInstantiatorConfig config)
        : config_(std::move(config)) {}

    asio::awaitable<ConductorResult<InstantiatedComponents>> async_instantiate(InitializeRequest /*request*/) override {
        InstantiatedComponents components;
        components.proxies.reserve(config_.proxies.size());
        for (const auto& spec : config_.proxies) {
            components.proxies.push_back(std::make_shared<StdioConnector>(to_connector_config(spec)));
        }
        components.agent = std::make_shared<StdioConnector>(to_connector_config(config_.agent));
        co_return components;
    }

private:
    StaticInstantiatorConfig config_;
};

class DynamicInstantiator final : public IInstantiator {
public:
    explicit DynamicInstantiator(DynamicInstantiatorFactory factory)
        : factory_(std::move(factory)) {}

    asio::awaitable<ConductorResult<InstantiatedComponents>> async_instantiate(InitializeRequest request) override {
        if (!factory_) {
            co_return tl::unexpected(ConductorError::instantiation_failed("No instantiation factory"));
        }
        co_return co_await factory_(std::move(request));
    }

private:
    DynamicInstantiatorFactory factory_;
};

}  // namespace

std::shared_ptr<IInstantiator> from_connectors(
    std::shared_ptr<IConnector> agent,
    std::vector<std::shared_ptr<IConnector>> proxies) {
    return std::make_shared<FixedInstantiator>(
        InstantiatedComponents{std::move(proxies), std::move(agent)});
}

std::shared_ptr<IInstantiator> static_instantiator(StaticInstantiatorConfig config) {
    return std::make_shared<CommandInstantiator>(std::move(config));
}

std::shared_ptr<IInstantiator> from_commands(std::vector<CommandSpec> commands) {
    if (commands.empty()) {
        throw std::invalid_argument("At least one command (the agent) is required");
    }

    StaticInstantiatorConfig config{{}, std::move(commands.back())};
    commands.pop_back();
    config.proxies = std::move(commands);
    return static_instantiator(std::move(config));
}

std::shared_ptr<IInstantiator> dynamic_instantiator(DynamicInstantiatorFactory factory) {
    return std::make_shared<DynamicInstantiator>(std::move(factory));
}

std::vector<std::string> split_command_line(std::string_view command_line) {
    std::vector<std::string> parts;
    std::string current;
    char quote = '\0';

    for (const char c : command_line) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current.push_back(c);
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ' ' || c == '\t') {
            if (current.empty() == false) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }

    if (current.empty() == false) {
        parts.push_back(std::move(current));
    }
    return parts;
}

StdioConnectorConfig to_connector_config(const CommandSpec& spec) {
    if (const auto* config = std::get_if<StdioConnectorConfig>(&spec)) {
        return *config;
    }

    auto parts = split_command_line(std::get<std::string>(spec));
    StdioConnectorConfig config;
    if (parts.empty()) {
        return config;
    }
    config.command = std::move(parts.front());
    config.args.assign(
        std::make_move_iterator(parts.begin() + 1),
        std::make_move_iterator(parts.end()));
    return config;
}

}  // namespace acpp
