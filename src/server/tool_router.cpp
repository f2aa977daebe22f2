#include "server/tool_router.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "tools/show_log.hpp"

namespace wrapmcp::server {

using core::errors::WrapError;
using nlohmann::json;

ToolRouter::ToolRouter(supervisor::ProcessSupervisor& supervisor, proxy::ToolProxy& proxy,
                       logstore::LogStore& store)
    : supervisor_(supervisor), proxy_(proxy), store_(store) {
    register_builtins();
}

void ToolRouter::register_builtins() {
    for (const auto& descriptor : tools::builtin_tool_descriptors()) {
        tools::BuiltinHandler handler;
        if (descriptor.name == tools::kShowLogTool) {
            handler = [this](const json& arguments) { return tools::show_log(arguments, store_); };
        } else if (descriptor.name == tools::kClearLogTool) {
            handler = [this](const json& arguments) { return tools::clear_log(arguments, store_); };
        } else if (descriptor.name == tools::kRestartTool) {
            handler = [this](const json& arguments) { return restart_wrapped_server(arguments); };
        } else {
            continue;
        }
        auto added = registry_.add(descriptor.name, std::move(handler));
        if (core::errors::is_error(added)) {
            LOG_ERROR(core::errors::get_error(added).message);
        }
    }
}

std::vector<protocol::ToolDescriptor> ToolRouter::list_tools() const {
    return proxy_.all_tools();
}

core::errors::Result<protocol::CallToolResult> ToolRouter::call_tool(const std::string& name,
                                                                     const json& arguments) {
    if (const auto* handler = registry_.find(name)) {
        LOG_DEBUG("Serving built-in tool: " + name);
        // show_log and clear_log stay out of the log store, errors included:
        // recording them would make show_log report its own invocations.
        // restart_wrapped_server logs itself.
        return (*handler)(arguments);
    }
    return supervisor_.call_tool(name, arguments);
}

core::errors::Result<protocol::CallToolResult> ToolRouter::restart_wrapped_server(
    const json& arguments) {
    const logstore::RequestId request_id = store_.add_request(tools::kRestartTool, arguments);

    auto restarted = supervisor_.restart();
    if (core::errors::is_error(restarted)) {
        WrapError error = core::errors::get_error(restarted);
        error.message = "Failed to restart wrapped server: " + error.message;
        store_.add_error(request_id, tools::kRestartTool, error.message);
        return error;
    }

    const auto& outcome = core::errors::get_value(restarted);
    const std::string old_pid =
        outcome.old_pid ? std::to_string(*outcome.old_pid) : std::string("none");
    auto result = protocol::CallToolResult::text(
        "Wrapped server restarted successfully (PID " + old_pid + " -> " +
        std::to_string(outcome.new_pid) + ")");
    result.structured_content =
        json{{"old_pid", outcome.old_pid ? json(*outcome.old_pid) : json(nullptr)},
             {"new_pid", outcome.new_pid}};
    store_.add_response(request_id, tools::kRestartTool,
                        json{{"result", protocol::to_json(result)}});
    return result;
}

}  // namespace wrapmcp::server
