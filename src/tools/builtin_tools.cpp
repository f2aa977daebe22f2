#include "tools/builtin_tools.hpp"

#include <utility>

namespace wrapmcp::tools {

using nlohmann::json;

namespace {

json empty_object_schema() {
    return json{{"type", "object"}, {"properties", json::object()}};
}

json show_log_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"limit",
           {{"type", "integer"},
            {"description", "Maximum number of log entries to show (default: 20)"},
            {"default", 20},
            {"minimum", 0}}},
          {"tool_name", {{"type", "string"}, {"description", "Filter logs by tool name"}}},
          {"entry_type",
           {{"type", "string"},
            {"enum", {"request", "response", "error", "stderr"}},
            {"description", "Filter logs by entry type"}}},
          {"keyword",
           {{"type", "string"},
            {"description",
             "Search entries for a regular expression (plain text when the pattern is invalid)"}}},
          {"format",
           {{"type", "string"},
            {"enum", {"ai", "text", "json"}},
            {"description", "Output format (default: ai)"},
            {"default", "ai"}}}}}};
}

}  // namespace

std::vector<protocol::ToolDescriptor> builtin_tool_descriptors() {
    std::vector<protocol::ToolDescriptor> tools;

    protocol::ToolDescriptor show_log;
    show_log.name = kShowLogTool;
    show_log.description = "Display recorded request/response logs from the wrapper";
    show_log.input_schema = show_log_schema();
    tools.push_back(std::move(show_log));

    protocol::ToolDescriptor clear_log;
    clear_log.name = kClearLogTool;
    clear_log.description = "Clear all recorded logs";
    clear_log.input_schema = empty_object_schema();
    tools.push_back(std::move(clear_log));

    protocol::ToolDescriptor restart;
    restart.name = kRestartTool;
    restart.description = "Restart the wrapped MCP server while preserving logs";
    restart.input_schema = empty_object_schema();
    tools.push_back(std::move(restart));

    return tools;
}

core::errors::Status BuiltinRegistry::add(const std::string& name, BuiltinHandler handler) {
    if (handlers_.count(name) > 0) {
        return core::errors::WrapError{core::errors::ErrorKind::Internal,
                                       "Built-in tool registered twice: " + name,
                                       "duplicate_builtin"};
    }
    handlers_.emplace(name, std::move(handler));
    return core::errors::ok();
}

const BuiltinHandler* BuiltinRegistry::find(const std::string& name) const {
    const auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace wrapmcp::tools
