#include "supervisor/process_supervisor.hpp"

#include <thread>
#include <utility>
#include "core/logging/logger.hpp"
#include "wrappee/process_transport.hpp"

namespace wrapmcp::supervisor {

using core::errors::ErrorKind;
using core::errors::WrapError;

std::string to_string(const SupervisorState state) {
    switch (state) {
        case SupervisorState::NoProcess:
            return "no_process";
        case SupervisorState::Starting:
            return "starting";
        case SupervisorState::Running:
            return "running";
        case SupervisorState::Restarting:
            return "restarting";
        default:
            return "unknown";
    }
}

TransportFactory process_transport_factory(const core::config::WrapConfig& config) {
    wrappee::TransportOptions options;
    options.request_timeout = config.tool_timeout;
    return [options](const wrappee::WrappeeSpawnConfig& spawn_config)
               -> core::errors::Result<std::unique_ptr<wrappee::WrappeeTransport>> {
        auto spawned = wrappee::ProcessTransport::spawn(spawn_config, options);
        if (core::errors::is_error(spawned)) {
            return core::errors::get_error(spawned);
        }
        return std::unique_ptr<wrappee::WrappeeTransport>(core::errors::take_value(spawned));
    };
}

ProcessSupervisor::ProcessSupervisor(const core::config::WrapConfig& config,
                                     proxy::ToolProxy& proxy, TransportFactory factory)
    : config_(config),
      proxy_(proxy),
      factory_(factory ? std::move(factory) : process_transport_factory(config)) {}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

bool ProcessSupervisor::configure(const wrappee::WrappeeSpawnConfig& spawn_config) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (spawn_config_.has_value()) {
        return false;
    }
    spawn_config_ = spawn_config;
    return true;
}

core::errors::Result<pid_t> ProcessSupervisor::start(
    const wrappee::WrappeeSpawnConfig& spawn_config) {
    static_cast<void>(configure(spawn_config));
    return start();
}

core::errors::Result<pid_t> ProcessSupervisor::start() {
    const auto stored = spawn_config();
    if (!stored.has_value()) {
        return WrapError{ErrorKind::ConfigMissing, "No wrapped server configuration to start",
                         "config_missing"};
    }
    std::lock_guard<std::mutex> slot(slot_mutex_);
    return start_locked(*stored);
}

core::errors::Result<pid_t> ProcessSupervisor::start_locked(
    const wrappee::WrappeeSpawnConfig& spawn_config) {
    {
        std::shared_lock<std::shared_mutex> lock(transport_mutex_);
        if (transport_ != nullptr) {
            return WrapError{ErrorKind::Internal,
                             "Wrapped server is already running (PID " +
                                 std::to_string(transport_->pid()) + ")",
                             "already_running", "Use restart_wrapped_server instead."};
        }
    }

    set_state(SupervisorState::Starting, std::nullopt);
    LOG_INFO("Starting wrapped server: " + spawn_config.command);

    auto spawned = factory_(spawn_config);
    if (core::errors::is_error(spawned)) {
        set_state(SupervisorState::NoProcess, std::nullopt);
        return core::errors::get_error(spawned);
    }
    std::unique_ptr<wrappee::WrappeeTransport> transport = core::errors::take_value(spawned);

    auto initialized = transport->initialize(config_.protocol_version);
    if (core::errors::is_error(initialized)) {
        LOG_ERROR("Failed to initialize wrapped server: " +
                  core::errors::get_error(initialized).message);
        transport->shutdown();
        set_state(SupervisorState::NoProcess, std::nullopt);
        return core::errors::get_error(initialized);
    }

    auto discovered = proxy_.discover(*transport);
    if (core::errors::is_error(discovered)) {
        LOG_ERROR("Failed to discover tools: " + core::errors::get_error(discovered).message);
        transport->shutdown();
        set_state(SupervisorState::NoProcess, std::nullopt);
        return core::errors::get_error(discovered);
    }

    const pid_t new_pid = transport->pid();
    {
        std::unique_lock<std::shared_mutex> lock(transport_mutex_);
        transport_ = std::move(transport);
    }
    set_state(SupervisorState::Running, new_pid);
    LOG_INFO("Wrapped server running (PID " + std::to_string(new_pid) + ")");
    return new_pid;
}

std::unique_ptr<wrappee::WrappeeTransport> ProcessSupervisor::take_transport() {
    std::unique_lock<std::shared_mutex> lock(transport_mutex_);
    return std::move(transport_);
}

core::errors::Result<RestartOutcome> ProcessSupervisor::restart() {
    const auto stored = spawn_config();
    if (!stored.has_value()) {
        return WrapError{ErrorKind::ConfigMissing, "No wrapped server to restart",
                         "config_missing"};
    }

    RestartOutcome outcome;
    {
        std::lock_guard<std::mutex> slot(slot_mutex_);
        LOG_INFO("Restarting wrapped server");

        std::unique_ptr<wrappee::WrappeeTransport> old = take_transport();
        set_state(SupervisorState::Restarting, std::nullopt);
        if (old != nullptr) {
            outcome.old_pid = old->pid();
            LOG_INFO("Shutting down wrapped server (PID " + std::to_string(old->pid()) + ")");
            old->shutdown();
            old.reset();
        }

        std::this_thread::sleep_for(config_.restart_grace);
        proxy_.clear_tools();

        auto started = start_locked(*stored);
        if (core::errors::is_error(started)) {
            return core::errors::get_error(started);
        }
        outcome.new_pid = core::errors::get_value(started);
    }

    LOG_INFO("Wrapped server restarted successfully");
    notify_tools_changed();
    return outcome;
}

core::errors::Result<protocol::CallToolResult> ProcessSupervisor::call_tool(
    const std::string& name, const nlohmann::json& arguments) {
    std::lock_guard<std::mutex> slot(slot_mutex_);
    std::shared_lock<std::shared_mutex> lock(transport_mutex_);
    return proxy_.call(name, arguments, transport_.get());
}

std::optional<std::string> ProcessSupervisor::poll_stderr() {
    std::shared_lock<std::shared_mutex> lock(transport_mutex_);
    if (transport_ == nullptr) {
        return std::nullopt;
    }
    return transport_->poll_stderr();
}

std::optional<pid_t> ProcessSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pid_;
}

SupervisorState ProcessSupervisor::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool ProcessSupervisor::is_active() const {
    return state() == SupervisorState::Running;
}

bool ProcessSupervisor::has_spawn_config() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return spawn_config_.has_value();
}

std::optional<wrappee::WrappeeSpawnConfig> ProcessSupervisor::spawn_config() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return spawn_config_;
}

void ProcessSupervisor::set_tools_changed_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    tools_changed_ = std::move(callback);
}

void ProcessSupervisor::notify_tools_changed() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        callback = tools_changed_;
    }
    if (callback) {
        callback();
    }
}

void ProcessSupervisor::shutdown() {
    // Kill first so an in-flight call fails fast and releases the slot.
    {
        std::shared_lock<std::shared_mutex> lock(transport_mutex_);
        if (transport_ != nullptr) {
            transport_->shutdown();
        }
    }
    std::lock_guard<std::mutex> slot(slot_mutex_);
    std::unique_ptr<wrappee::WrappeeTransport> transport = take_transport();
    if (transport != nullptr) {
        LOG_INFO("Wrapped server stopped (PID " + std::to_string(transport->pid()) + ")");
    }
    transport.reset();
    set_state(SupervisorState::NoProcess, std::nullopt);
}

void ProcessSupervisor::set_state(const SupervisorState state, const std::optional<pid_t> pid) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
    pid_ = pid;
}

}  // namespace wrapmcp::supervisor
