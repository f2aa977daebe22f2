#include "tools/show_log.hpp"

#include <cctype>
#include <cstdint>
#include <sstream>
#include "core/logging/logger.hpp"

namespace wrapmcp::tools {

using core::errors::ErrorKind;
using core::errors::WrapError;
using nlohmann::json;

namespace {

WrapError invalid_params(const std::string& message) {
    return WrapError{ErrorKind::Input, "Invalid parameters: " + message, "invalid_params"};
}

core::errors::Result<std::optional<std::string>> optional_string(const json& arguments,
                                                                 const char* key) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return std::optional<std::string>{};
    }
    if (!arguments[key].is_string()) {
        return invalid_params(std::string("'") + key + "' must be a string");
    }
    return std::optional<std::string>(arguments[key].get<std::string>());
}

// Prefix scanners for strip_log_prefix. Each returns the position just past
// its prefix, or `pos` unchanged when the prefix is not there.
bool is_digit(const char c) {
    return c >= '0' && c <= '9';
}

bool is_word(const char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) != 0 || c == '_';
}

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::size_t skip_spaces(const std::string& text, std::size_t pos) {
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

// Exactly `count` digits at `pos`.
bool digits_at(const std::string& text, const std::size_t pos, const std::size_t count) {
    if (pos + count > text.size()) {
        return false;
    }
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!is_digit(text[i])) {
            return false;
        }
    }
    return true;
}

// Requires at least one whitespace character and skips all of them.
std::size_t require_spaces(const std::string& text, const std::size_t pos,
                           const std::size_t fallback) {
    const std::size_t end = skip_spaces(text, pos);
    return end == pos ? fallback : end;
}

// 2025-08-08T16:15:53[.880856][Z|+02:00|+0200] followed by whitespace.
std::size_t match_timestamp(const std::string& text, const std::size_t pos) {
    std::size_t at = skip_spaces(text, pos);
    if (!digits_at(text, at, 4) || at + 19 > text.size() || text[at + 4] != '-' ||
        !digits_at(text, at + 5, 2) || text[at + 7] != '-' || !digits_at(text, at + 8, 2) ||
        (text[at + 10] != 'T' && text[at + 10] != ' ') || !digits_at(text, at + 11, 2) ||
        text[at + 13] != ':' || !digits_at(text, at + 14, 2) || text[at + 16] != ':' ||
        !digits_at(text, at + 17, 2)) {
        return pos;
    }
    at += 19;
    if (at + 1 < text.size() && text[at] == '.' && is_digit(text[at + 1])) {
        ++at;
        while (at < text.size() && is_digit(text[at])) {
            ++at;
        }
    }
    if (at < text.size() && text[at] == 'Z') {
        ++at;
    } else if (at < text.size() && (text[at] == '+' || text[at] == '-') &&
               digits_at(text, at + 1, 2)) {
        std::size_t zone = at + 3;
        if (zone < text.size() && text[zone] == ':') {
            ++zone;
        }
        if (digits_at(text, zone, 2)) {
            at = zone + 2;
        }
    }
    return require_spaces(text, at, pos);
}

bool is_level_name(const std::string& word) {
    return word == "TRACE" || word == "DEBUG" || word == "INFO" || word == "WARN" ||
           word == "WARNING" || word == "ERROR";
}

std::size_t upper_word_end(const std::string& text, std::size_t pos) {
    while (pos < text.size() && text[pos] >= 'A' && text[pos] <= 'Z') {
        ++pos;
    }
    return pos;
}

// "INFO " or "[INFO ]".
std::size_t match_level(const std::string& text, const std::size_t pos) {
    if (pos < text.size() && text[pos] == '[') {
        const std::size_t end = upper_word_end(text, pos + 1);
        if (!is_level_name(text.substr(pos + 1, end - pos - 1))) {
            return pos;
        }
        const std::size_t close = skip_spaces(text, end);
        if (close >= text.size() || text[close] != ']') {
            return pos;
        }
        return skip_spaces(text, close + 1);
    }
    const std::size_t end = upper_word_end(text, pos);
    if (!is_level_name(text.substr(pos, end - pos))) {
        return pos;
    }
    return require_spaces(text, end, pos);
}

// "ThreadId(01) ".
std::size_t match_thread_id(const std::string& text, const std::size_t pos) {
    static const std::string kOpen = "ThreadId(";
    if (text.compare(pos, kOpen.size(), kOpen) != 0) {
        return pos;
    }
    std::size_t at = pos + kOpen.size();
    const std::size_t digits = at;
    while (at < text.size() && is_digit(text[at])) {
        ++at;
    }
    if (at == digits || at >= text.size() || text[at] != ')') {
        return pos;
    }
    return require_spaces(text, at + 1, pos);
}

// "my_server::handler: ".
std::size_t match_module_path(const std::string& text, const std::size_t pos) {
    if (pos >= text.size() || !(std::isalpha(static_cast<unsigned char>(text[pos])) ||
                                text[pos] == '_')) {
        return pos;
    }
    std::size_t at = pos + 1;
    while (at < text.size() && is_word(text[at])) {
        ++at;
    }
    while (at + 2 < text.size() && text[at] == ':' && text[at + 1] == ':' &&
           is_word(text[at + 2])) {
        at += 2;
        while (at < text.size() && is_word(text[at])) {
            ++at;
        }
    }
    if (at >= text.size() || text[at] != ':') {
        return pos;
    }
    return require_spaces(text, at + 1, pos);
}

bool is_path_char(const char c) {
    return is_word(c) || c == '.' || c == '/' || c == '-';
}

// "src/handler.rs:42: ".
std::size_t match_file_line(const std::string& text, const std::size_t pos) {
    std::size_t at = pos;
    while (at < text.size() && is_path_char(text[at])) {
        ++at;
    }
    if (at == pos || at >= text.size() || text[at] != ':') {
        return pos;
    }
    const std::size_t dot = text.rfind('.', at - 1);
    if (dot == std::string::npos || dot <= pos || dot + 1 == at) {
        return pos;
    }
    for (std::size_t i = dot + 1; i < at; ++i) {
        if (!is_word(text[i])) {
            return pos;
        }
    }
    std::size_t line_no = at + 1;
    while (line_no < text.size() && is_digit(text[line_no])) {
        ++line_no;
    }
    if (line_no == at + 1 || line_no >= text.size() || text[line_no] != ':') {
        return pos;
    }
    return require_spaces(text, line_no + 1, pos);
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string format_argument(const json& value) {
    if (value.is_string()) {
        return "\"" + value.get<std::string>() + "\"";
    }
    return value.dump();
}

std::string format_arguments(const json& arguments) {
    if (!arguments.is_object()) {
        return arguments.dump();
    }
    std::string joined;
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += it.key() + ": " + format_argument(it.value());
    }
    return joined;
}

void render_response(std::ostringstream& out, const logstore::ResponseEntry& response) {
    const json* result = nullptr;
    if (response.payload.is_object() && response.payload.contains("result")) {
        result = &response.payload["result"];
    }

    bool printed = false;
    if (result != nullptr && result->is_object() && result->contains("content") &&
        (*result)["content"].is_array()) {
        for (const auto& item : (*result)["content"]) {
            if (item.is_object() && item.contains("text") && item["text"].is_string()) {
                out << "[RESPONSE #" << response.request_id << "] \""
                    << item["text"].get<std::string>() << "\"\n";
                printed = true;
            }
        }
    }
    if (!printed) {
        const json& shown = result != nullptr ? *result : response.payload;
        out << "[RESPONSE #" << response.request_id << "] " << shown.dump() << "\n";
    }
}

}  // namespace

core::errors::Result<ShowLogRequest> parse_show_log_request(const json& arguments) {
    ShowLogRequest request;
    if (arguments.is_null()) {
        return request;
    }
    if (!arguments.is_object()) {
        return invalid_params("arguments must be an object");
    }

    if (arguments.contains("limit") && !arguments["limit"].is_null()) {
        const json& limit = arguments["limit"];
        if (limit.is_number_unsigned()) {
            request.limit = limit.get<std::size_t>();
        } else if (limit.is_number_integer()) {
            if (limit.get<std::int64_t>() < 0) {
                return invalid_params("'limit' must not be negative");
            }
            request.limit = static_cast<std::size_t>(limit.get<std::int64_t>());
        } else {
            return invalid_params("'limit' must be an integer");
        }
    }

    auto tool_name = optional_string(arguments, "tool_name");
    if (core::errors::is_error(tool_name)) {
        return core::errors::get_error(tool_name);
    }
    request.tool_name = core::errors::take_value(tool_name);

    auto entry_type = optional_string(arguments, "entry_type");
    if (core::errors::is_error(entry_type)) {
        return core::errors::get_error(entry_type);
    }
    if (const auto& text = core::errors::get_value(entry_type)) {
        request.entry_type = logstore::parse_entry_type(*text);
        if (!request.entry_type.has_value()) {
            return invalid_params("unknown entry_type '" + *text +
                                  "' (expected request, response, error or stderr)");
        }
    }

    auto keyword = optional_string(arguments, "keyword");
    if (core::errors::is_error(keyword)) {
        return core::errors::get_error(keyword);
    }
    request.keyword = core::errors::take_value(keyword);

    auto format = optional_string(arguments, "format");
    if (core::errors::is_error(format)) {
        return core::errors::get_error(format);
    }
    if (const auto& text = core::errors::get_value(format)) {
        const std::string name = trim(*text);
        if (name == "text") {
            request.format = LogFormat::Text;
        } else if (name == "json") {
            request.format = LogFormat::Json;
        } else {
            request.format = LogFormat::Ai;
        }
    }
    return request;
}

std::string strip_log_prefix(const std::string& line) {
    std::size_t pos = match_timestamp(line, 0);

    const std::size_t after_level = match_level(line, pos);
    if (after_level == pos) {
        return line.substr(pos);
    }
    pos = match_thread_id(line, after_level);
    // A module path only counts when it is not already the file location.
    if (match_file_line(line, pos) == pos) {
        pos = match_module_path(line, pos);
    }
    pos = match_file_line(line, pos);
    return line.substr(pos);
}

std::string render_ai(const std::vector<logstore::LogEntry>& entries) {
    if (entries.empty()) {
        return "No log entries found.\n";
    }

    std::ostringstream out;
    for (const auto& entry : entries) {
        if (const auto* request = std::get_if<logstore::RequestEntry>(&entry.content)) {
            out << "[REQUEST #" << entry.id << "] " << request->tool_name << "("
                << format_arguments(request->arguments) << ")\n";
        } else if (const auto* response = std::get_if<logstore::ResponseEntry>(&entry.content)) {
            render_response(out, *response);
        } else if (const auto* error = std::get_if<logstore::ErrorEntry>(&entry.content)) {
            out << "[ERROR #" << error->request_id << "] " << error->message << "\n";
        } else if (const auto* stderr_entry = std::get_if<logstore::StderrEntry>(&entry.content)) {
            out << "[STDERR] " << strip_log_prefix(stderr_entry->text) << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string render_text(const std::vector<logstore::LogEntry>& entries) {
    if (entries.empty()) {
        return "No log entries found.\n";
    }

    std::ostringstream out;
    for (const auto& entry : entries) {
        out << "[#" << entry.id << "] " << logstore::format_utc(entry.timestamp) << " | "
            << logstore::to_string(logstore::entry_type(entry)) << "\n";
        if (const auto name = logstore::tool_name(entry)) {
            out << "Tool: " << *name << "\n";
        }
        out << "Content: " << logstore::content_to_json(entry.content).dump(2) << "\n";
        out << std::string(60, '-') << "\n";
    }
    return out.str();
}

std::string render_json(const std::vector<logstore::LogEntry>& entries) {
    json array = json::array();
    for (const auto& entry : entries) {
        array.push_back(logstore::to_json(entry));
    }
    return array.dump(2, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<protocol::CallToolResult> show_log(const json& arguments,
                                                        const logstore::LogStore& store) {
    auto parsed = parse_show_log_request(arguments);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const ShowLogRequest& request = core::errors::get_value(parsed);
    LOG_DEBUG("show_log called with limit " + std::to_string(request.limit));

    logstore::LogFilter filter;
    filter.tool_name = request.tool_name;
    filter.entry_type = request.entry_type;
    filter.keyword = request.keyword;
    const auto entries = store.get_logs(request.limit, filter);

    switch (request.format) {
        case LogFormat::Text:
            return protocol::CallToolResult::text(render_text(entries));
        case LogFormat::Json:
            return protocol::CallToolResult::text(render_json(entries));
        case LogFormat::Ai:
        default:
            return protocol::CallToolResult::text(render_ai(entries));
    }
}

core::errors::Result<protocol::CallToolResult> clear_log(const json& arguments,
                                                         logstore::LogStore& store) {
    if (!arguments.is_null() && !arguments.is_object()) {
        return invalid_params("arguments must be an object");
    }
    const std::size_t cleared = store.clear();
    LOG_INFO("Cleared " + std::to_string(cleared) + " log entries");
    return protocol::CallToolResult::text("Cleared " + std::to_string(cleared) +
                                          " log entries");
}

}  // namespace wrapmcp::tools
