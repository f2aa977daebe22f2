#include "wrappee/process_transport.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/config/wrap_config.hpp"
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc.hpp"
#include "wrappee/executable.hpp"

extern char** environ;

namespace wrapmcp::wrappee {

using core::errors::ErrorKind;
using core::errors::WrapError;
using nlohmann::json;

namespace {

constexpr int kReaderPollMs = 100;
constexpr std::size_t kMaxLoggedLine = 240;

// Variables that make common CLI/logging stacks drop color codes.
const char* const kNoColorEnv[][2] = {
    {"NO_COLOR", "1"},
    {"CLICOLOR", "0"},
    {"RUST_LOG_STYLE", "never"},
};

std::string trim_line(const std::string& line) {
    if (line.size() <= kMaxLoggedLine) {
        return line;
    }
    return line.substr(0, kMaxLoggedLine) + "...";
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// A dead wrappee must surface as EPIPE on write, not kill the wrapper.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        static_cast<void>(sigaction(SIGPIPE, &action, nullptr));
    });
}

std::vector<std::string> build_environment(const bool disable_colors) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string value(*entry);
        if (disable_colors) {
            bool overridden = false;
            for (const auto& pair : kNoColorEnv) {
                if (value.rfind(std::string(pair[0]) + "=", 0) == 0) {
                    overridden = true;
                    break;
                }
            }
            if (overridden) {
                continue;
            }
        }
        env.push_back(value);
    }
    if (disable_colors) {
        for (const auto& pair : kNoColorEnv) {
            env.push_back(std::string(pair[0]) + "=" + pair[1]);
        }
    }
    return env;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

std::string describe_exit(const int status) {
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

}  // namespace

core::errors::Result<std::unique_ptr<ProcessTransport>> ProcessTransport::spawn(
    const WrappeeSpawnConfig& config, const TransportOptions options) {
    LOG_INFO("Spawning wrappee process: " + config.command);

    const auto resolved = resolve_executable(config.command);
    if (!resolved.has_value()) {
        return WrapError{ErrorKind::Spawn,
                         "Failed to spawn wrappee process '" + config.command +
                             "': command not found or not executable",
                         "command_not_found",
                         "Check the command after '--' and that it is executable."};
    }

    ignore_sigpipe_once();

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(config.command);
    for (const auto& arg : config.arguments) {
        argv_storage.push_back(arg);
    }
    std::vector<std::string> env_storage = build_environment(config.disable_colors);
    std::vector<char*> argv = to_pointer_array(argv_storage);
    std::vector<char*> envp = to_pointer_array(env_storage);
    const std::string executable = resolved->string();
    if (config.disable_colors) {
        LOG_DEBUG("Setting NO_COLOR=1, CLICOLOR=0, RUST_LOG_STYLE=never for wrappee");
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return WrapError{ErrorKind::Spawn, "Failed to create process pipes: " + reason,
                         "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return WrapError{ErrorKind::Spawn, "Failed to fork process: " + reason, "fork_failed"};
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        struct sigaction action {};
        action.sa_handler = SIG_DFL;
        sigemptyset(&action.sa_mask);
        static_cast<void>(sigaction(SIGPIPE, &action, nullptr));
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        static_cast<void>(sigprocmask(SIG_SETMASK, &empty_mask, nullptr));

        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execve(executable.c_str(), argv.data(), envp.data());

        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF means exec succeeded (close-on-exec); an int means it failed.
    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return WrapError{ErrorKind::Spawn,
                         "Failed to spawn wrappee process '" + config.command +
                             "': " + std::strerror(exec_errno),
                         "exec_failed"};
    }

    LOG_INFO("Wrappee process started (PID " + std::to_string(pid) + ")");
    return std::make_unique<ProcessTransport>(SpawnedKey{}, pid, stdin_pipe[1], stdout_pipe[0],
                                              stderr_pipe[0], options);
}

ProcessTransport::ProcessTransport(SpawnedKey, const pid_t pid, const int stdin_fd,
                                   const int stdout_fd, const int stderr_fd,
                                   const TransportOptions options)
    : pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      options_(options),
      stdout_lines_(options.channel_capacity),
      stderr_lines_(options.channel_capacity) {
    stdout_reader_ = std::thread([this] { reader_loop(stdout_fd_, stdout_lines_, "stdout"); });
    stderr_reader_ = std::thread([this] { reader_loop(stderr_fd_, stderr_lines_, "stderr"); });
}

ProcessTransport::~ProcessTransport() {
    shutdown();
}

void ProcessTransport::reader_loop(const int fd, core::sync::BoundedChannel<std::string>& channel,
                                   const std::string& stream_name) {
    LOG_DEBUG("Starting " + stream_name + " reader for PID " + std::to_string(pid_));
    std::string pending;
    char buffer[4096];
    bool open = true;

    while (open && !stopping_.load()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int ready = poll(&pfd, 1, kReaderPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("Error polling wrappee " + stream_name + ": " + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            LOG_ERROR("Error reading wrappee " + stream_name + ": " + std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t start = 0;
        std::size_t newline = pending.find('\n', start);
        while (newline != std::string::npos) {
            std::string line = pending.substr(start, newline - start);
            start = newline + 1;
            newline = pending.find('\n', start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }
            LOG_DEBUG("Wrappee " + stream_name + ": " + trim_line(line));
            if (!channel.send(std::move(line))) {
                open = false;
                break;
            }
        }
        pending.erase(0, start);
    }

    if (open && !pending.empty() && !stopping_.load()) {
        static_cast<void>(channel.send(std::move(pending)));
    }
    channel.close();
    LOG_DEBUG("Wrappee " + stream_name + " reader finished");
}

core::errors::Status ProcessTransport::send(const json& message) {
    const std::string line =
        message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    LOG_DEBUG("Sending to wrappee: " + trim_line(line.substr(0, line.size() - 1)));

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        return WrapError{ErrorKind::IoClosed, "Wrappee stdin is closed", "stdin_closed"};
    }
    std::size_t total = 0;
    while (total < line.size()) {
        const ssize_t n = write(stdin_fd_, line.data() + total, line.size() - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int write_errno = errno;
            if (write_errno == EPIPE) {
                return WrapError{ErrorKind::IoClosed,
                                 "Wrappee stdin closed unexpectedly", "stdin_closed"};
            }
            return WrapError{ErrorKind::IoClosed,
                             std::string("Failed to write to wrappee: ") +
                                 std::strerror(write_errno),
                             "write_failed"};
        }
        total += static_cast<std::size_t>(n);
    }
    return core::errors::ok();
}

core::errors::Result<json> ProcessTransport::await_response(
    const std::chrono::milliseconds timeout) {
    std::string line;
    switch (stdout_lines_.recv_for(line, timeout)) {
        case core::sync::RecvStatus::Item: {
            json message = json::parse(line, nullptr, false);
            if (message.is_discarded()) {
                return WrapError{ErrorKind::Protocol,
                                 "Invalid JSON from wrappee: " + trim_line(line),
                                 "invalid_json"};
            }
            return message;
        }
        case core::sync::RecvStatus::Timeout:
            return WrapError{ErrorKind::Timeout,
                             "Timed out after " + std::to_string(timeout.count()) +
                                 " ms waiting for wrappee response",
                             "response_timeout"};
        case core::sync::RecvStatus::Closed:
        default:
            return WrapError{ErrorKind::IoClosed, "Wrappee stdout closed unexpectedly",
                             "stdout_closed"};
    }
}

core::errors::Result<json> ProcessTransport::request(const std::int64_t id,
                                                     const std::string& method,
                                                     const json& params) {
    // A late answer to a timed-out request must not become this one's.
    const std::size_t stale = stdout_lines_.discard();
    if (stale > 0) {
        LOG_WARN("Discarded " + std::to_string(stale) + " stale wrappee message(s) before " +
                 method);
    }

    auto sent = send(protocol::jsonrpc::make_request(id, method, params));
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.request_timeout;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return WrapError{ErrorKind::Timeout,
                             method + " timed out after " +
                                 std::to_string(options_.request_timeout.count()) + " ms",
                             "response_timeout"};
        }

        auto received = await_response(remaining);
        if (core::errors::is_error(received)) {
            auto error = core::errors::get_error(received);
            if (error.kind == ErrorKind::Timeout) {
                error.message = method + " timed out after " +
                                std::to_string(options_.request_timeout.count()) + " ms";
            }
            return error;
        }

        json message = core::errors::take_value(received);
        if (!message.is_object()) {
            return WrapError{ErrorKind::Protocol, "Wrappee message is not a JSON object",
                             "unexpected_message"};
        }
        // Wrappee-initiated notifications and requests are not responses.
        if (message.contains("method")) {
            LOG_DEBUG("Skipping wrappee message '" + message["method"].dump() +
                      "' while waiting for " + method);
            continue;
        }
        return message;
    }
}

core::errors::Result<json> ProcessTransport::initialize(const std::string& protocol_version) {
    LOG_INFO("Initializing wrappee with protocol version: " + protocol_version);
    const json params = {
        {"protocolVersion", protocol_version},
        {"capabilities", json::object()},
        {"clientInfo",
         {{"name", core::config::kServerName}, {"version", core::config::kServerVersion}}}};

    auto response = request(protocol::jsonrpc::kInitializeId, "initialize", params);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const json& message = core::errors::get_value(response);
    if (message.contains("error")) {
        const auto& error = message["error"];
        const std::string reason = error.is_object() ? error.value("message", error.dump())
                                                     : error.dump();
        return WrapError{ErrorKind::Protocol, "Wrappee rejected initialize: " + reason,
                         "initialize_rejected"};
    }

    auto notified = send(protocol::jsonrpc::make_notification("notifications/initialized"));
    if (core::errors::is_error(notified)) {
        return core::errors::get_error(notified);
    }
    return message;
}

core::errors::Result<json> ProcessTransport::list_tools() {
    return request(protocol::jsonrpc::kListToolsId, "tools/list", json::object());
}

core::errors::Result<json> ProcessTransport::call_tool(const std::string& name,
                                                       const json& arguments) {
    LOG_INFO("Calling tool '" + name + "' with timeout " +
             std::to_string(options_.request_timeout.count()) + " ms");
    auto response = request(protocol::jsonrpc::kCallToolId, "tools/call",
                            json{{"name", name}, {"arguments", arguments}});
    if (core::errors::is_error(response)) {
        auto error = core::errors::get_error(response);
        error.message = "Tool '" + name + "' execution failed: " + error.message;
        return error;
    }
    return response;
}

std::optional<std::string> ProcessTransport::poll_stderr() {
    return stderr_lines_.try_recv();
}

void ProcessTransport::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (reaped_) {
        return;
    }
    stopping_.store(true);

    if (kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("Failed to kill wrappee PID " + std::to_string(pid_) + ": " +
                 std::strerror(errno));
    }
    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid_, &status, 0);
    } while (waited < 0 && errno == EINTR);
    reaped_ = true;
    if (waited == pid_) {
        LOG_INFO("Wrappee PID " + std::to_string(pid_) + " exited (" + describe_exit(status) +
                 ")");
    }

    stdout_lines_.close();
    stderr_lines_.close();
    if (stdout_reader_.joinable()) {
        stdout_reader_.join();
    }
    if (stderr_reader_.joinable()) {
        stderr_reader_.join();
    }

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        close_fd(stdin_fd_);
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

}  // namespace wrapmcp::wrappee
