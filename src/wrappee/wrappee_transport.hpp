#pragma once

#include <optional>
#include <string>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "core/errors/wrap_errors.hpp"

namespace wrapmcp::wrappee {

// Channel to one wrapped server. Responses are matched positionally, so a
// transport must never have two requests in flight: callers serialize.
class WrappeeTransport {
public:
    virtual ~WrappeeTransport() = default;

    // Handshake; must be the first call. Returns the initialize response.
    virtual core::errors::Result<nlohmann::json> initialize(
        const std::string& protocol_version) = 0;

    // Both return the full JSON-RPC response (`result` or `error` inside).
    virtual core::errors::Result<nlohmann::json> list_tools() = 0;
    virtual core::errors::Result<nlohmann::json> call_tool(
        const std::string& name, const nlohmann::json& arguments) = 0;

    // Non-blocking.
    virtual std::optional<std::string> poll_stderr() = 0;

    virtual pid_t pid() const = 0;

    // Force-kills the process and waits for it to exit. Safe to run while
    // a request is in flight: that request then fails with IoClosed.
    virtual void shutdown() = 0;
};

}  // namespace wrapmcp::wrappee
