#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/wrap_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace wrapmcp::tools {

inline constexpr const char* kShowLogTool = "show_log";
inline constexpr const char* kClearLogTool = "clear_log";
inline constexpr const char* kRestartTool = "restart_wrapped_server";

// Descriptors of the tools the wrapper itself serves, in listing order.
std::vector<protocol::ToolDescriptor> builtin_tool_descriptors();

using BuiltinHandler =
    std::function<core::errors::Result<protocol::CallToolResult>(const nlohmann::json&)>;

// Handlers for the wrapper's own tools, consulted before a call is
// forwarded to the wrappee.
class BuiltinRegistry {
public:
    // Fails with `duplicate_builtin` when the name is taken.
    core::errors::Status add(const std::string& name, BuiltinHandler handler);

    // Null when `name` is not a built-in.
    const BuiltinHandler* find(const std::string& name) const;

private:
    std::unordered_map<std::string, BuiltinHandler> handlers_;
};

}  // namespace wrapmcp::tools
