#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace wrapmcp::core::errors {

    // 1. Define typed error kinds
    enum class ErrorKind {
        Spawn,           // The wrappee process could not be launched
        Protocol,        // Malformed or unexpected message from the wrappee
        Timeout,         // No response within the deadline
        IoClosed,        // Wrappee I/O channel closed (process died)
        Tool,            // Wrappee reported an application-level tool error
        ConfigMissing,   // Restart requested before any spawn configuration
        NotInitialized,  // Call arrived with no active wrappee
        Input,           // Invalid CLI flag, env value or tool arguments
        Internal         // Pipe/fork failures and logic bugs
    };

    // The standardized error payload
    struct WrapError {
        ErrorKind kind;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";                   // Helpful tips for the operator
        nlohmann::json data = nullptr;           // Passed through to the upstream client
    };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a WrapError.
    template <typename T>
    using Result = std::variant<T, WrapError>;

    // For operations that only succeed or fail
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<WrapError>(result);
    }

    template <typename T>
    const WrapError& get_error(const Result<T>& result) {
        return std::get<WrapError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Spawn: return "spawn";
            case ErrorKind::Protocol: return "protocol";
            case ErrorKind::Timeout: return "timeout";
            case ErrorKind::IoClosed: return "io_closed";
            case ErrorKind::Tool: return "tool";
            case ErrorKind::ConfigMissing: return "config_missing";
            case ErrorKind::NotInitialized: return "not_initialized";
            case ErrorKind::Input: return "input";
            case ErrorKind::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace wrapmcp::core::errors
