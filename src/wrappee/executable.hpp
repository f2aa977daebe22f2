#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace wrapmcp::wrappee {

// Path of an existing executable for `command`: taken as a path when it
// contains '/', looked up in PATH otherwise.
std::optional<std::filesystem::path> resolve_executable(const std::string& command);

// The file to watch for `command`, whether or not it exists yet.
std::filesystem::path resolve_watch_path(const std::string& command);

}  // namespace wrapmcp::wrappee
