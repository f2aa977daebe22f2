#include "core/config/wrap_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <system_error>

namespace wrapmcp::core::config {

using errors::ErrorKind;
using errors::WrapError;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Exception-free integer parsing
errors::Result<std::uint64_t> parse_positive(const std::string& var,
                                             const std::string& text) {
    std::uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return WrapError{ErrorKind::Input,
                         "Failed to parse " + var + " as an integer: '" + text + "'",
                         "invalid_env_value", "Provide a positive integer."};
    }
    if (value == 0) {
        return WrapError{ErrorKind::Input, var + " must be greater than 0",
                         "invalid_env_value", "Provide a positive integer."};
    }
    return value;
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

errors::Result<WrapConfig> load_from_env(const EnvLookup& lookup) {
    WrapConfig config;

    if (auto logsize = lookup("WRAP_MCP_LOGSIZE")) {
        auto parsed = parse_positive("WRAP_MCP_LOGSIZE", *logsize);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.log_capacity = static_cast<std::size_t>(errors::get_value(parsed));
    }

    if (auto timeout = lookup("WRAP_MCP_TOOL_TIMEOUT")) {
        auto parsed = parse_positive("WRAP_MCP_TOOL_TIMEOUT", *timeout);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.tool_timeout = std::chrono::seconds(errors::get_value(parsed));
    }

    if (auto version = lookup("WRAP_MCP_PROTOCOL_VERSION")) {
        if (version->empty()) {
            return WrapError{ErrorKind::Input,
                             "WRAP_MCP_PROTOCOL_VERSION cannot be empty",
                             "invalid_env_value"};
        }
        config.protocol_version = *version;
    }

    if (auto colors = lookup("WRAP_MCP_LOG_COLORS")) {
        const std::string value = lowercase(*colors);
        config.log_colors = (value == "true" || value == "1");
    }

    if (auto level = lookup("WRAP_MCP_LOG_LEVEL")) {
        auto parsed = logging::parse_level(lowercase(*level));
        if (!parsed.has_value()) {
            return WrapError{ErrorKind::Input,
                             "Unknown WRAP_MCP_LOG_LEVEL: " + *level,
                             "invalid_env_value",
                             "Use one of debug, info, warn, error."};
        }
        config.log_level = *parsed;
    }

    return config;
}

}  // namespace wrapmcp::core::config
