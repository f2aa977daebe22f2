#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/wrap_errors.hpp"
#include "core/logging/logger.hpp"

#ifndef WRAPMCP_VERSION
#define WRAPMCP_VERSION "0.0.0"
#endif

namespace wrapmcp::core::config {

inline constexpr const char* kServerName = "wrap-mcp";
inline constexpr const char* kServerVersion = WRAPMCP_VERSION;

// Built once in main and passed by reference to each component.
struct WrapConfig {
    std::size_t log_capacity = 1000;
    std::chrono::milliseconds tool_timeout{30000};
    std::string protocol_version = "2025-03-26";
    logging::LogLevel log_level = logging::LogLevel::INFO;
    bool log_colors = false;

    // Command-line controlled
    bool watch_binary = false;
    bool preserve_ansi = false;
    bool disable_wrappee_colors = true;

    // Pause between killing the old wrappee and spawning the new one.
    std::chrono::milliseconds restart_grace{500};
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

// Reads the WRAP_MCP_* variables on top of the defaults.
errors::Result<WrapConfig> load_from_env(const EnvLookup& lookup = process_env);

}  // namespace wrapmcp::core::config
