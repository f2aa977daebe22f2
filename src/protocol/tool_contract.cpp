#include "protocol/tool_contract.hpp"

namespace wrapmcp::protocol {

using core::errors::ErrorKind;
using core::errors::WrapError;
using nlohmann::json;

CallToolResult CallToolResult::text(const std::string& text) {
    CallToolResult result;
    result.content.push_back(json{{"type", "text"}, {"text", text}});
    return result;
}

json to_json(const ToolDescriptor& tool) {
    json payload = tool.extra.is_object() ? tool.extra : json::object();
    payload["name"] = tool.name;
    if (!tool.description.empty()) {
        payload["description"] = tool.description;
    }
    payload["inputSchema"] = tool.input_schema;
    return payload;
}

core::errors::Result<ToolDescriptor> parse_tool_descriptor(const json& value) {
    if (!value.is_object()) {
        return WrapError{ErrorKind::Protocol, "Tool descriptor is not an object",
                         "invalid_tool_descriptor"};
    }
    const auto name = value.find("name");
    if (name == value.end() || !name->is_string() || name->get<std::string>().empty()) {
        return WrapError{ErrorKind::Protocol, "Tool descriptor has no name",
                         "invalid_tool_descriptor"};
    }

    ToolDescriptor tool;
    tool.name = name->get<std::string>();

    const auto description = value.find("description");
    if (description != value.end() && description->is_string()) {
        tool.description = description->get<std::string>();
    }

    const auto schema = value.find("inputSchema");
    if (schema != value.end() && schema->is_object()) {
        tool.input_schema = *schema;
    } else {
        tool.input_schema = json{{"type", "object"}, {"properties", json::object()}};
    }

    for (auto it = value.begin(); it != value.end(); ++it) {
        if (it.key() == "name" || it.key() == "description" || it.key() == "inputSchema") {
            continue;
        }
        tool.extra[it.key()] = it.value();
    }
    return tool;
}

json to_json(const CallToolResult& result) {
    json payload;
    payload["content"] = result.content;
    if (result.is_error) {
        payload["isError"] = true;
    }
    if (result.structured_content.has_value()) {
        payload["structuredContent"] = *result.structured_content;
    }
    return payload;
}

core::errors::Result<CallToolResult> parse_call_tool_result(const json& value) {
    if (!value.is_object()) {
        return WrapError{ErrorKind::Protocol, "Tool result is not an object",
                         "invalid_tool_result"};
    }
    const auto content = value.find("content");
    if (content == value.end() || !content->is_array()) {
        return WrapError{ErrorKind::Protocol, "Tool result has no content array",
                         "invalid_tool_result"};
    }

    CallToolResult result;
    for (const auto& item : *content) {
        const auto type = item.is_object() ? item.find("type") : item.end();
        if (!item.is_object() || type == item.end() || !type->is_string()) {
            return WrapError{ErrorKind::Protocol, "Tool content item has no type",
                             "invalid_tool_result"};
        }
        result.content.push_back(item);
    }

    const auto is_error = value.find("isError");
    if (is_error != value.end()) {
        if (!is_error->is_boolean()) {
            return WrapError{ErrorKind::Protocol, "isError must be a boolean",
                             "invalid_tool_result"};
        }
        result.is_error = is_error->get<bool>();
    }

    const auto structured = value.find("structuredContent");
    if (structured != value.end() && !structured->is_null()) {
        result.structured_content = *structured;
    }
    return result;
}

std::string joined_text(const CallToolResult& result) {
    std::string out;
    for (const auto& item : result.content) {
        if (item.value("type", "") != "text") {
            continue;
        }
        if (!out.empty()) {
            out += "\n";
        }
        out += item.value("text", "");
    }
    return out;
}

} // namespace wrapmcp::protocol
