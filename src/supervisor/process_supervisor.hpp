#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "core/config/wrap_config.hpp"
#include "core/errors/wrap_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "proxy/tool_proxy.hpp"
#include "wrappee/spawn_config.hpp"
#include "wrappee/wrappee_transport.hpp"

namespace wrapmcp::supervisor {

enum class SupervisorState {
    NoProcess,
    Starting,
    Running,
    Restarting
};

std::string to_string(SupervisorState state);

using TransportFactory =
    std::function<core::errors::Result<std::unique_ptr<wrappee::WrappeeTransport>>(
        const wrappee::WrappeeSpawnConfig&)>;

// Spawns ProcessTransports with the timeout taken from `config`.
TransportFactory process_transport_factory(const core::config::WrapConfig& config);

struct RestartOutcome {
    std::optional<pid_t> old_pid;
    pid_t new_pid = -1;
};

// Owns the single running wrappee. A slot mutex serializes tool calls
// against each other and against start/restart, so a call never sees a
// half-replaced wrappee and at most one child exists at any time.
class ProcessSupervisor {
public:
    ProcessSupervisor(const core::config::WrapConfig& config, proxy::ToolProxy& proxy,
                      TransportFactory factory = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Stores the config unless one is already stored; returns false then.
    bool configure(const wrappee::WrappeeSpawnConfig& spawn_config);

    // Spawn, handshake and discover. The first config seen is kept for
    // every later start and restart.
    core::errors::Result<pid_t> start(const wrappee::WrappeeSpawnConfig& spawn_config);
    core::errors::Result<pid_t> start();

    // Kill the current wrappee (if any), wait the grace period, start anew
    // and fire the tools-changed callback.
    core::errors::Result<RestartOutcome> restart();

    core::errors::Result<protocol::CallToolResult> call_tool(const std::string& name,
                                                             const nlohmann::json& arguments);

    std::optional<std::string> poll_stderr();

    std::optional<pid_t> pid() const;
    SupervisorState state() const;
    bool is_active() const;
    bool has_spawn_config() const;
    std::optional<wrappee::WrappeeSpawnConfig> spawn_config() const;

    void set_tools_changed_callback(std::function<void()> callback);
    void notify_tools_changed();

    void shutdown();

private:
    // Caller holds slot_mutex_.
    core::errors::Result<pid_t> start_locked(const wrappee::WrappeeSpawnConfig& spawn_config);
    std::unique_ptr<wrappee::WrappeeTransport> take_transport();
    void set_state(SupervisorState state, std::optional<pid_t> pid);

    const core::config::WrapConfig& config_;
    proxy::ToolProxy& proxy_;
    TransportFactory factory_;

    std::mutex slot_mutex_;
    // Guards the pointer itself: shared to use it, exclusive to replace it.
    mutable std::shared_mutex transport_mutex_;
    std::unique_ptr<wrappee::WrappeeTransport> transport_;

    mutable std::mutex state_mutex_;
    SupervisorState state_ = SupervisorState::NoProcess;
    std::optional<pid_t> pid_;
    std::optional<wrappee::WrappeeSpawnConfig> spawn_config_;
    std::function<void()> tools_changed_;
};

}  // namespace wrapmcp::supervisor
