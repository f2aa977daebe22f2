#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/wrap_errors.hpp"

namespace wrapmcp::protocol {

    // A tool as advertised to the upstream client
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();

        // Any other descriptor fields (title, annotations, outputSchema)
        // are carried through untouched.
        nlohmann::json extra = nlohmann::json::object();
    };

    // The success payload of tools/call
    struct CallToolResult {
        std::vector<nlohmann::json> content;  // typed content items
        bool is_error = false;
        std::optional<nlohmann::json> structured_content;

        static CallToolResult text(const std::string& text);
    };

    nlohmann::json to_json(const ToolDescriptor& tool);
    core::errors::Result<ToolDescriptor> parse_tool_descriptor(const nlohmann::json& value);

    nlohmann::json to_json(const CallToolResult& result);

    // Succeeds only when `value` has the shape of a tool result:
    // an object with a `content` array of objects carrying a string `type`.
    core::errors::Result<CallToolResult> parse_call_tool_result(const nlohmann::json& value);

    // Concatenates the text items of a result, one per line.
    std::string joined_text(const CallToolResult& result);

} // namespace wrapmcp::protocol
