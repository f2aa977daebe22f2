#include "proxy/tool_proxy.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "tools/builtin_tools.hpp"

namespace wrapmcp::proxy {

using core::errors::ErrorKind;
using core::errors::WrapError;
using nlohmann::json;

ToolProxy::ToolProxy(logstore::LogStore& log_store) : log_store_(log_store) {}

core::errors::Result<std::size_t> ToolProxy::discover(wrappee::WrappeeTransport& transport) {
    LOG_INFO("Discovering tools from wrappee");

    auto response = transport.list_tools();
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const json& message = core::errors::get_value(response);

    if (message.contains("error")) {
        const auto& error = message["error"];
        const std::string reason = error.is_object() ? error.value("message", error.dump())
                                                     : error.dump();
        return WrapError{ErrorKind::Protocol, "Wrappee rejected tools/list: " + reason,
                         "list_tools_rejected"};
    }
    if (!message.contains("result") || !message["result"].is_object() ||
        !message["result"].contains("tools") || !message["result"]["tools"].is_array()) {
        return WrapError{ErrorKind::Protocol, "tools/list response has no tools array",
                         "invalid_tools_list"};
    }

    std::vector<protocol::ToolDescriptor> discovered;
    for (const auto& item : message["result"]["tools"]) {
        auto parsed = protocol::parse_tool_descriptor(item);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        discovered.push_back(core::errors::take_value(parsed));
    }

    for (const auto& tool : discovered) {
        LOG_DEBUG("  - " + tool.name + ": " + tool.description);
    }
    const std::size_t count = discovered.size();
    {
        std::lock_guard<std::mutex> lock(tools_mutex_);
        tools_ = std::move(discovered);
    }
    LOG_INFO("Discovered " + std::to_string(count) + " tools from wrappee");
    return count;
}

std::vector<protocol::ToolDescriptor> ToolProxy::all_tools() const {
    std::vector<protocol::ToolDescriptor> tools = wrappee_tools();
    for (auto& builtin : tools::builtin_tool_descriptors()) {
        tools.push_back(std::move(builtin));
    }
    return tools;
}

std::vector<protocol::ToolDescriptor> ToolProxy::wrappee_tools() const {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    return tools_;
}

void ToolProxy::clear_tools() {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    tools_.clear();
    LOG_INFO("Cleared all discovered tools");
}

core::errors::Result<protocol::CallToolResult> ToolProxy::call(
    const std::string& name, const json& arguments, wrappee::WrappeeTransport* transport) {
    LOG_INFO("Proxying tool call: " + name);
    const logstore::RequestId request_id = log_store_.add_request(name, arguments);

    if (transport == nullptr) {
        const WrapError error{ErrorKind::NotInitialized, "Wrappee not initialized",
                              "not_initialized",
                              "The wrapped server is not running; wait for it or restart it."};
        log_store_.add_error(request_id, name, "Failed to call tool: " + error.message);
        return error;
    }

    auto response = transport->call_tool(name, arguments);
    if (core::errors::is_error(response)) {
        WrapError error = core::errors::get_error(response);
        error.message = "Failed to call tool: " + error.message;
        log_store_.add_error(request_id, name, error.message);
        return error;
    }
    const json& message = core::errors::get_value(response);

    if (message.contains("result")) {
        log_store_.add_response(request_id, name, message);
        const json& result = message["result"];
        auto parsed = protocol::parse_call_tool_result(result);
        if (!core::errors::is_error(parsed)) {
            return core::errors::take_value(parsed);
        }
        return protocol::CallToolResult::text(result.dump(2));
    }

    if (message.contains("error")) {
        const json& error = message["error"];
        std::string error_message = "Unknown error";
        json data = nullptr;
        if (error.is_object()) {
            if (error.contains("message") && error["message"].is_string()) {
                error_message = error["message"].get<std::string>();
            }
            if (error.contains("data")) {
                data = error["data"];
            }
        }
        log_store_.add_error(request_id, name, error_message);
        return WrapError{ErrorKind::Tool, error_message, "tool_error", "", data};
    }

    log_store_.add_response(request_id, name, message);
    return protocol::CallToolResult::text(message.dump(2));
}

}  // namespace wrapmcp::proxy
