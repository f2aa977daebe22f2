#include "wrappee/executable.hpp"

#include <cstdlib>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace wrapmcp::wrappee {

namespace {

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::filesystem::path absolute_or_self(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path;
    }
    return absolute.lexically_normal();
}

}  // namespace

std::optional<std::filesystem::path> resolve_executable(const std::string& command) {
    if (command.empty()) {
        return std::nullopt;
    }
    if (command.find('/') != std::string::npos) {
        const std::filesystem::path path(command);
        if (is_executable_file(path)) {
            return absolute_or_self(path);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::istringstream dirs(path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const auto candidate = std::filesystem::path(dir) / command;
        if (is_executable_file(candidate)) {
            return absolute_or_self(candidate);
        }
    }
    return std::nullopt;
}

std::filesystem::path resolve_watch_path(const std::string& command) {
    if (auto resolved = resolve_executable(command)) {
        return *resolved;
    }
    return absolute_or_self(std::filesystem::path(command));
}

}  // namespace wrapmcp::wrappee
