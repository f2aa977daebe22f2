#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "core/errors/wrap_errors.hpp"
#include "core/sync/bounded_channel.hpp"
#include "wrappee/spawn_config.hpp"
#include "wrappee/wrappee_transport.hpp"

namespace wrapmcp::wrappee {

struct TransportOptions {
    std::chrono::milliseconds request_timeout{30000};
    std::size_t channel_capacity = 100;
};

// A wrapped server running as a child process, spoken to with one JSON
// message per line over its stdin/stdout. Two reader threads turn the
// stdout and stderr pipes into bounded line channels.
class ProcessTransport final : public WrappeeTransport {
    struct SpawnedKey {
        explicit SpawnedKey() = default;
    };

public:
    static core::errors::Result<std::unique_ptr<ProcessTransport>> spawn(
        const WrappeeSpawnConfig& config, TransportOptions options = {});

    // Only reachable through spawn(), which owns the fork.
    ProcessTransport(SpawnedKey, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                     TransportOptions options);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    core::errors::Result<nlohmann::json> initialize(
        const std::string& protocol_version) override;
    core::errors::Result<nlohmann::json> list_tools() override;
    core::errors::Result<nlohmann::json> call_tool(
        const std::string& name, const nlohmann::json& arguments) override;
    std::optional<std::string> poll_stderr() override;
    pid_t pid() const override { return pid_; }
    void shutdown() override;

    core::errors::Status send(const nlohmann::json& message);
    core::errors::Result<nlohmann::json> await_response(std::chrono::milliseconds timeout);

private:
    core::errors::Result<nlohmann::json> request(std::int64_t id, const std::string& method,
                                                 const nlohmann::json& params);
    void reader_loop(int fd, core::sync::BoundedChannel<std::string>& channel,
                     const std::string& stream_name);

    const pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    const TransportOptions options_;

    core::sync::BoundedChannel<std::string> stdout_lines_;
    core::sync::BoundedChannel<std::string> stderr_lines_;
    std::atomic_bool stopping_{false};
    std::thread stdout_reader_;
    std::thread stderr_reader_;

    std::mutex write_mutex_;
    std::mutex lifecycle_mutex_;
    bool reaped_ = false;
};

}  // namespace wrapmcp::wrappee
