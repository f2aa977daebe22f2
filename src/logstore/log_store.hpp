#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "logstore/log_entry.hpp"
#include "logstore/log_filter.hpp"

namespace wrapmcp::logstore {

// Bounded FIFO of log entries. Reads take a shared lock, writes an
// exclusive one; entries are only ever handed out as copies.
class LogStore {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit LogStore(std::size_t capacity = kDefaultCapacity, bool strip_ansi = true);

    RequestId add_request(const std::string& tool_name, const nlohmann::json& arguments);
    RequestId add_response(RequestId request_id, const std::string& tool_name,
                           const nlohmann::json& payload);
    RequestId add_error(RequestId request_id, const std::string& tool_name,
                        const std::string& message);
    RequestId add_stderr(const std::string& text);

    // Newest first, filtered, then truncated to `limit`.
    std::vector<LogEntry> get_logs(std::optional<std::size_t> limit = std::nullopt,
                                   const LogFilter& filter = {}) const;
    std::size_t get_log_count() const;

    // Empties the store and resets ids; returns the number of entries removed.
    std::size_t clear();

    std::size_t capacity() const { return capacity_; }
    void set_ansi_removal(bool enabled);
    bool ansi_removal() const;

    static std::string remove_ansi_sequences(const std::string& text);

private:
    RequestId append(LogContent content);

    const std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::deque<LogEntry> entries_;
    RequestId next_id_ = 1;
    bool strip_ansi_;
};

}  // namespace wrapmcp::logstore
