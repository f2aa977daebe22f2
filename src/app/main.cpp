#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <pthread.h>
#include <signal.h>
#include <string>
#include "app/cli_parser.hpp"
#include "app/termination_watcher.hpp"
#include "core/config/wrap_config.hpp"
#include "core/errors/wrap_errors.hpp"
#include "core/logging/logger.hpp"
#include "logstore/log_store.hpp"
#include "proxy/tool_proxy.hpp"
#include "server/stdio_server.hpp"
#include "server/tool_router.hpp"
#include "supervisor/process_supervisor.hpp"
#include "supervisor/stderr_monitor.hpp"
#include "watch/file_watch_restarter.hpp"
#include "wrappee/executable.hpp"

int main(int argc, char* argv[]) {
    using namespace wrapmcp;

    // 1. Parse CLI input and return normalized input errors
    auto parsed = app::cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        if (err.code == "help_requested") {
            std::cerr << err.hint << std::endl;
            return 0;
        }
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = core::errors::get_value(parsed);

    // 2. Environment configuration, then the logger it controls
    auto loaded = core::config::load_from_env();
    if (core::errors::is_error(loaded)) {
        const auto& err = core::errors::get_error(loaded);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    core::config::WrapConfig config = core::errors::get_value(loaded);
    config.watch_binary = options.watch_binary;
    config.preserve_ansi = options.preserve_ansi;
    config.disable_wrappee_colors = !options.preserve_ansi;

    core::logging::Logger::get().set_level(config.log_level);
    core::logging::Logger::get().set_colors(config.log_colors);
    LOG_INFO(std::string("Starting ") + core::config::kServerName + " " +
             core::config::kServerVersion);
    LOG_INFO(config.preserve_ansi ? "ANSI escape sequences will be preserved (--ansi option)"
                                  : "ANSI escape sequence removal enabled (default)");

    // 3. Termination signals go to one dedicated thread; block them before
    //    any other thread exists so every thread inherits the mask.
    sigset_t termination;
    sigemptyset(&termination);
    sigaddset(&termination, SIGINT);
    sigaddset(&termination, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &termination, nullptr);

    // 4. Components, leaves first
    logstore::LogStore log_store(config.log_capacity, !config.preserve_ansi);
    proxy::ToolProxy tool_proxy(log_store);
    supervisor::ProcessSupervisor process_supervisor(config, tool_proxy);
    server::ToolRouter router(process_supervisor, tool_proxy, log_store);
    server::StdioServer stdio_server(router, config, std::cin, std::cout);
    process_supervisor.set_tools_changed_callback(
        [&stdio_server] { stdio_server.notify_tools_list_changed(); });

    supervisor::StderrMonitor stderr_monitor(
        [&process_supervisor] { return process_supervisor.poll_stderr(); }, log_store);
    const std::filesystem::path watch_path = wrappee::resolve_watch_path(options.command);
    watch::FileWatchRestarter watcher(watch_path, process_supervisor);

    std::once_flag shutdown_once;
    const auto shutdown_all = [&] {
        std::call_once(shutdown_once, [&] {
            stderr_monitor.stop();
            watcher.stop();
            process_supervisor.shutdown();
        });
    };

    // Declared after the components so it is joined before they are destroyed.
    app::TerminationWatcher termination_watcher(
        termination, SIGTERM, [&shutdown_all](const int received) {
            LOG_INFO("Received signal " + std::to_string(received) + ", shutting down");
            shutdown_all();
            std::cout.flush();
            std::_Exit(0);
        });

    // 5. Initial start
    wrappee::WrappeeSpawnConfig spawn_config;
    spawn_config.command = options.command;
    spawn_config.arguments = options.arguments;
    spawn_config.disable_colors = config.disable_wrappee_colors;

    const bool binary_present = wrappee::resolve_executable(options.command).has_value();
    if (config.watch_binary && !binary_present) {
        static_cast<void>(process_supervisor.configure(spawn_config));
        LOG_INFO("Wrapped binary " + watch_path.string() +
                 " not found yet; it will start once it appears");
    } else {
        auto started = process_supervisor.start(spawn_config);
        if (core::errors::is_error(started)) {
            const auto& err = core::errors::get_error(started);
            if (!config.watch_binary) {
                LOG_ERROR("Failed to start wrapped server [" + err.code + "]: " + err.message);
                return 1;
            }
            LOG_ERROR("Failed to start wrapped server [" + err.code + "]: " + err.message +
                      " (waiting for the binary to change)");
        }
    }

    stderr_monitor.start();
    if (config.watch_binary) {
        auto watching = watcher.start();
        if (core::errors::is_error(watching)) {
            const auto& err = core::errors::get_error(watching);
            LOG_ERROR("File watching disabled [" + err.code + "]: " + err.message);
        }
    }

    // 6. Serve until the client goes away
    stdio_server.run();

    shutdown_all();
    LOG_INFO("Shutdown complete");
    return 0;
}
