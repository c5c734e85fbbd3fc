#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Connectors
// ═══════════════════════════════════════════════════════════════════════════
// StdioConnector spawns a component as a child process and talks to it over
// its stdin/stdout. The child's stderr is inherited.
//
// StdioServerConnector serves the conductor's own stdin/stdout, for when
// the conductor itself is a component of some outer editor or conductor.

#include "acpp/connection/stream_connection.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>  // pid_t

namespace acpp {

struct StdioConnectorConfig {
    std::string command;
    std::vector<std::string> args;

    /// Merged over the conductor's environment; these entries win
    std::map<std::string, std::string> env;

    /// Working directory for the child; inherited when empty
    std::optional<std::string> cwd;
};

/// Child process connection. Close sequence: stdin is closed, then the
/// child gets a grace period to exit, then SIGTERM, then SIGKILL.
class ProcessConnection final : public StreamConnection {
public:
    static constexpr std::chrono::milliseconds kExitGracePeriod{250};
    static constexpr std::chrono::milliseconds kTerminateGracePeriod{500};

    ProcessConnection(asio::any_io_executor executor, pid_t pid, int stdout_fd, int stdin_fd, std::string label);
    ~ProcessConnection() override;

    [[nodiscard]] pid_t child_pid() const noexcept { return child_pid_; }

    /// Exit status once reaped: exit code, or -signal when killed
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }

protected:
    [[nodiscard]] asio::awaitable<void> after_output_closed() override;

private:
    bool try_reap();
    void reap_blocking();

    pid_t child_pid_;
    std::optional<int> exit_code_;
};

class StdioConnector final : public IConnector {
public:
    explicit StdioConnector(StdioConnectorConfig config);

    /// Fails if the process cannot be started (including a failed exec)
    [[nodiscard]] asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
    async_connect(asio::any_io_executor executor) override;

    [[nodiscard]] const StdioConnectorConfig& config() const noexcept { return config_; }

private:
    StdioConnectorConfig config_;
};

class StdioServerConnector final : public IConnector {
public:
    StdioServerConnector() = default;

    [[nodiscard]] asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
    async_connect(asio::any_io_executor executor) override;
};

}  // namespace acpp
