#include "acpp/connection/stdio_connector.hpp"

#include "acpp/async/spawn.hpp"
#include "acpp/log/logger.hpp"

#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <string_view>
#include <utility>

extern char** environ;

namespace acpp {

namespace {

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int read_end{-1};
    int write_end{-1};

    ~Pipe() {
        close_fd(read_end);
        close_fd(write_end);
    }

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) == -1) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    int release_read() { return std::exchange(read_end, -1); }
    int release_write() { return std::exchange(write_end, -1); }
};

// Writes to an exited child must surface as EPIPE instead of killing us
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view pair(*entry);
        const auto eq = pair.find('=');
        const std::string key(pair.substr(0, eq));
        if (overrides.contains(key) == false) {
            entries.emplace_back(pair);
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> as_pointers(std::vector<std::string>& storage) {
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& entry : storage) {
        pointers.push_back(entry.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

std::string describe_command(const StdioConnectorConfig& config) {
    std::string text = config.command;
    for (const auto& arg : config.args) {
        text += " " + arg;
    }
    return text;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// ProcessConnection
// ═══════════════════════════════════════════════════════════════════════════

ProcessConnection::ProcessConnection(
    asio::any_io_executor executor,
    pid_t pid,
    int stdout_fd,
    int stdin_fd,
    std::string label)
    : StreamConnection(std::move(executor), stdout_fd, stdin_fd, std::move(label))
    , child_pid_(pid) {}

ProcessConnection::~ProcessConnection() {
    // Synchronous cleanup - can't co_await in destructor
    if (child_pid_ > 0 && try_reap() == false) {
        ::kill(child_pid_, SIGKILL);
        reap_blocking();
    }
}

bool ProcessConnection::try_reap() {
    if (child_pid_ <= 0) {
        return true;
    }
    int status = 0;
    const pid_t result = ::waitpid(child_pid_, &status, WNOHANG);
    if (result == 0) {
        return false;
    }
    if (result > 0) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);
        }
    }
    child_pid_ = -1;
    return true;
}

void ProcessConnection::reap_blocking() {
    if (child_pid_ <= 0) {
        return;
    }
    int status = 0;
    pid_t result = -1;
    do {
        result = ::waitpid(child_pid_, &status, 0);
    } while (result == -1 && errno == EINTR);
    if (result > 0 && WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);
    } else if (result > 0 && WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    }
    child_pid_ = -1;
}

asio::awaitable<void> ProcessConnection::after_output_closed() {
    if (co_await poll_until([this] { return try_reap(); }, kExitGracePeriod)) {
        co_return;
    }

    ACPP_LOG_DEBUG(label() + ": sending SIGTERM");
    ::kill(child_pid_, SIGTERM);
    if (co_await poll_until([this] { return try_reap(); }, kTerminateGracePeriod)) {
        co_return;
    }

    ACPP_LOG_WARN(label() + ": did not exit after SIGTERM, sending SIGKILL");
    ::kill(child_pid_, SIGKILL);
    reap_blocking();
}

// ═══════════════════════════════════════════════════════════════════════════
// StdioConnector
// ═══════════════════════════════════════════════════════════════════════════

StdioConnector::StdioConnector(StdioConnectorConfig config)
    : config_(std::move(config)) {}

asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
StdioConnector::async_connect(asio::any_io_executor executor) {
    if (config_.command.empty()) {
        co_return tl::unexpected(TransportError::network("Empty command"));
    }

    ignore_sigpipe_once();

    // After fork() only this thread exists in the child; another thread may
    // hold the allocator lock, so everything the child touches is built here.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv = as_pointers(argv_storage);

    std::vector<std::string> env_storage = merged_environment(config_.env);
    std::vector<char*> envp = as_pointers(env_storage);

    const char* cwd = config_.cwd.has_value() ? config_.cwd->c_str() : nullptr;

    Pipe stdin_pipe;
    Pipe stdout_pipe;
    Pipe exec_status;  // stays open in the child only if exec fails
    if (!stdin_pipe.open() || !stdout_pipe.open() || !exec_status.open()) {
        const int err = errno;
        co_return tl::unexpected(TransportError::network(
            "Failed to create pipes: " + std::string(std::strerror(err)), err));
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int err = errno;
        co_return tl::unexpected(TransportError::network(
            "Failed to fork: " + std::string(std::strerror(err)), err));
    }

    if (pid == 0) {
        // Child - no allocations from here on
        ::dup2(stdin_pipe.read_end, STDIN_FILENO);
        ::dup2(stdout_pipe.write_end, STDOUT_FILENO);

        int err = 0;
        if (cwd != nullptr && ::chdir(cwd) == -1) {
            err = errno;
        } else {
            environ = envp.data();
            ::execvp(argv[0], argv.data());
            err = errno;
        }
        [[maybe_unused]] const auto written = ::write(exec_status.write_end, &err, sizeof(err));
        ::_exit(127);
    }

    // Parent
    close_fd(stdin_pipe.read_end);
    close_fd(stdout_pipe.write_end);
    close_fd(exec_status.write_end);

    int child_errno = 0;
    ssize_t n = -1;
    do {
        n = ::read(exec_status.read_end, &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        co_return tl::unexpected(TransportError::network(
            "Failed to start '" + describe_command(config_) + "': " + std::strerror(child_errno),
            child_errno));
    }

    auto label = "component '" + config_.command + "' (pid " + std::to_string(pid) + ")";
    ACPP_LOG_INFO("Spawned " + label);

    co_return std::unique_ptr<IConnection>(std::make_unique<ProcessConnection>(
        std::move(executor), pid, stdout_pipe.release_read(), stdin_pipe.release_write(), std::move(label)));
}

// ═══════════════════════════════════════════════════════════════════════════
// StdioServerConnector
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<TransportResult<std::unique_ptr<IConnection>>>
StdioServerConnector::async_connect(asio::any_io_executor executor) {
    ignore_sigpipe_once();

    int input_fd = ::fcntl(STDIN_FILENO, F_DUPFD_CLOEXEC, 0);
    int output_fd = ::fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 0);
    if (input_fd == -1 || output_fd == -1) {
        const int err = errno;
        close_fd(input_fd);
        close_fd(output_fd);
        co_return tl::unexpected(TransportError::network(
            "Failed to duplicate stdio descriptors: " + std::string(std::strerror(err)), err));
    }

    co_return std::unique_ptr<IConnection>(std::make_unique<StreamConnection>(
        std::move(executor), input_fd, output_fd, std::string("stdio client")));
}

}  // namespace acpp
