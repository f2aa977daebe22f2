#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace wrapmcp::logstore {

// Wrapper-internal id; unrelated to the ids on the wrappee wire.
using RequestId = std::uint64_t;
using Timestamp = std::chrono::system_clock::time_point;

struct RequestEntry {
    std::string tool_name;
    nlohmann::json arguments;
};

struct ResponseEntry {
    std::string tool_name;
    RequestId request_id = 0;
    nlohmann::json payload;
};

struct ErrorEntry {
    std::string tool_name;
    RequestId request_id = 0;
    std::string message;
};

struct StderrEntry {
    std::string text;
};

using LogContent = std::variant<RequestEntry, ResponseEntry, ErrorEntry, StderrEntry>;

struct LogEntry {
    RequestId id = 0;
    Timestamp timestamp;
    LogContent content;
};

enum class EntryType {
    Request,
    Response,
    Error,
    Stderr
};

EntryType entry_type(const LogEntry& entry);
std::string to_string(EntryType type);
std::optional<EntryType> parse_entry_type(const std::string& text);

// Empty for stderr entries.
std::optional<std::string> tool_name(const LogEntry& entry);

// `{"type": ..., <variant fields>}`; also the haystack for keyword search.
nlohmann::json content_to_json(const LogContent& content);
nlohmann::json to_json(const LogEntry& entry);

// 2025-01-31T12:00:00.123456Z
std::string format_iso8601(Timestamp timestamp);
// 2025-01-31 12:00:00 UTC
std::string format_utc(Timestamp timestamp);

}  // namespace wrapmcp::logstore
