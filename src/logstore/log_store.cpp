#include "logstore/log_store.hpp"

#include <algorithm>
#include <mutex>
#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::logstore {

LogStore::LogStore(const std::size_t capacity, const bool strip_ansi)
    : capacity_(capacity == 0 ? 1 : capacity), strip_ansi_(strip_ansi) {
    LOG_INFO("LogStore: initialized with capacity " + std::to_string(capacity_));
}

RequestId LogStore::append(LogContent content) {
    std::size_t evicted = 0;
    RequestId id = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        id = next_id_++;
        entries_.push_back(LogEntry{id, std::chrono::system_clock::now(), std::move(content)});
        while (entries_.size() > capacity_) {
            entries_.pop_front();
            ++evicted;
        }
    }
    if (evicted > 0) {
        LOG_DEBUG("LogStore: trimmed " + std::to_string(evicted) + " old entries");
    }
    return id;
}

RequestId LogStore::add_request(const std::string& tool_name,
                                const nlohmann::json& arguments) {
    const RequestId id = append(RequestEntry{tool_name, arguments});
    LOG_DEBUG("LogStore: request #" + std::to_string(id) + " (" + tool_name + ")");
    return id;
}

RequestId LogStore::add_response(const RequestId request_id, const std::string& tool_name,
                                 const nlohmann::json& payload) {
    const RequestId id = append(ResponseEntry{tool_name, request_id, payload});
    LOG_DEBUG("LogStore: response #" + std::to_string(id) + " for request #" +
              std::to_string(request_id));
    return id;
}

RequestId LogStore::add_error(const RequestId request_id, const std::string& tool_name,
                              const std::string& message) {
    const RequestId id = append(ErrorEntry{tool_name, request_id, message});
    LOG_WARN("LogStore: error #" + std::to_string(id) + " for request #" +
             std::to_string(request_id) + ": " + message);
    return id;
}

RequestId LogStore::add_stderr(const std::string& text) {
    const bool strip = ansi_removal();
    const RequestId id = append(StderrEntry{strip ? remove_ansi_sequences(text) : text});
    LOG_DEBUG("LogStore: stderr #" + std::to_string(id) + ": " + text);
    return id;
}

std::vector<LogEntry> LogStore::get_logs(const std::optional<std::size_t> limit,
                                         const LogFilter& filter) const {
    const LogFilterMatcher matcher(filter);
    std::vector<LogEntry> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            if (matcher.matches(entry)) {
                result.push_back(entry);
            }
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const LogEntry& a, const LogEntry& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.id > b.id;
    });

    if (limit.has_value() && result.size() > *limit) {
        result.resize(*limit);
    }
    return result;
}

std::size_t LogStore::get_log_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::size_t LogStore::clear() {
    std::size_t cleared = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cleared = entries_.size();
        entries_.clear();
        next_id_ = 1;
    }
    LOG_INFO("LogStore: cleared " + std::to_string(cleared) + " entries");
    return cleared;
}

void LogStore::set_ansi_removal(const bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    strip_ansi_ = enabled;
}

bool LogStore::ansi_removal() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return strip_ansi_;
}

std::string LogStore::remove_ansi_sequences(const std::string& text) {
    // ESC[...m, ESC[...K, ESC[...H and friends
    static const std::string kFinal = "mGKHJF";
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] == '\x1b' && pos + 1 < text.size() && text[pos + 1] == '[') {
            std::size_t end = pos + 2;
            while (end < text.size() && ((text[end] >= '0' && text[end] <= '9') ||
                                         text[end] == ';')) {
                ++end;
            }
            if (end < text.size() && kFinal.find(text[end]) != std::string::npos) {
                pos = end + 1;
                continue;
            }
        }
        out += text[pos];
        ++pos;
    }
    return out;
}

}  // namespace wrapmcp::logstore
