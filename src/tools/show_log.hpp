#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/wrap_errors.hpp"
#include "logstore/log_store.hpp"
#include "protocol/tool_contract.hpp"

namespace wrapmcp::tools {

enum class LogFormat {
    Ai,
    Text,
    Json
};

struct ShowLogRequest {
    std::size_t limit = 20;
    std::optional<std::string> tool_name;
    std::optional<logstore::EntryType> entry_type;
    std::optional<std::string> keyword;
    LogFormat format = LogFormat::Ai;
};

// Unknown formats fall back to Ai; a bad limit or entry type is an Input error.
core::errors::Result<ShowLogRequest> parse_show_log_request(const nlohmann::json& arguments);

std::string render_ai(const std::vector<logstore::LogEntry>& entries);
std::string render_text(const std::vector<logstore::LogEntry>& entries);
std::string render_json(const std::vector<logstore::LogEntry>& entries);

// Drops the timestamp / level / thread / module / file:line prefix that
// logging frameworks put in front of a stderr line.
std::string strip_log_prefix(const std::string& line);

core::errors::Result<protocol::CallToolResult> show_log(const nlohmann::json& arguments,
                                                        const logstore::LogStore& store);

// Empties the store; answers "Cleared N log entries".
core::errors::Result<protocol::CallToolResult> clear_log(const nlohmann::json& arguments,
                                                         logstore::LogStore& store);

}  // namespace wrapmcp::tools
