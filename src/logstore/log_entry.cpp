#include "logstore/log_entry.hpp"

#include <cstdio>
#include <ctime>
#include <type_traits>

namespace wrapmcp::logstore {

using nlohmann::json;

namespace {

std::tm to_utc_tm(const Timestamp timestamp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return tm;
}

}  // namespace

EntryType entry_type(const LogEntry& entry) {
    return std::visit(
        [](const auto& content) -> EntryType {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, RequestEntry>) {
                return EntryType::Request;
            } else if constexpr (std::is_same_v<T, ResponseEntry>) {
                return EntryType::Response;
            } else if constexpr (std::is_same_v<T, ErrorEntry>) {
                return EntryType::Error;
            } else {
                return EntryType::Stderr;
            }
        },
        entry.content);
}

std::string to_string(const EntryType type) {
    switch (type) {
        case EntryType::Request:
            return "request";
        case EntryType::Response:
            return "response";
        case EntryType::Error:
            return "error";
        case EntryType::Stderr:
            return "stderr";
        default:
            return "unknown";
    }
}

std::optional<EntryType> parse_entry_type(const std::string& text) {
    if (text == "request") return EntryType::Request;
    if (text == "response") return EntryType::Response;
    if (text == "error") return EntryType::Error;
    if (text == "stderr") return EntryType::Stderr;
    return std::nullopt;
}

std::optional<std::string> tool_name(const LogEntry& entry) {
    if (const auto* request = std::get_if<RequestEntry>(&entry.content)) {
        return request->tool_name;
    }
    if (const auto* response = std::get_if<ResponseEntry>(&entry.content)) {
        return response->tool_name;
    }
    if (const auto* error = std::get_if<ErrorEntry>(&entry.content)) {
        return error->tool_name;
    }
    return std::nullopt;
}

json content_to_json(const LogContent& content) {
    json payload;
    if (const auto* request = std::get_if<RequestEntry>(&content)) {
        payload["type"] = "request";
        payload["tool_name"] = request->tool_name;
        payload["content"] = json{{"tool", request->tool_name},
                                  {"arguments", request->arguments}};
    } else if (const auto* response = std::get_if<ResponseEntry>(&content)) {
        payload["type"] = "response";
        payload["tool_name"] = response->tool_name;
        payload["request_id"] = response->request_id;
        payload["response"] = response->payload;
    } else if (const auto* error = std::get_if<ErrorEntry>(&content)) {
        payload["type"] = "error";
        payload["tool_name"] = error->tool_name;
        payload["request_id"] = error->request_id;
        payload["error"] = error->message;
    } else if (const auto* line = std::get_if<StderrEntry>(&content)) {
        payload["type"] = "stderr";
        payload["message"] = line->text;
    }
    return payload;
}

json to_json(const LogEntry& entry) {
    json payload = content_to_json(entry.content);
    payload["id"] = entry.id;
    payload["timestamp"] = format_iso8601(entry.timestamp);
    return payload;
}

std::string format_iso8601(const Timestamp timestamp) {
    const std::tm tm = to_utc_tm(timestamp);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            timestamp.time_since_epoch())
                            .count() %
                        1000000;
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char full[48];
    std::snprintf(full, sizeof(full), "%s.%06dZ", date, static_cast<int>(micros));
    return full;
}

std::string format_utc(const Timestamp timestamp) {
    const std::tm tm = to_utc_tm(timestamp);
    char buffer[40];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &tm);
    return buffer;
}

}  // namespace wrapmcp::logstore
