#include "logstore/log_filter.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace wrapmcp::logstore {

LogFilterMatcher::LogFilterMatcher(LogFilter filter) : filter_(std::move(filter)) {
    if (!filter_.keyword.has_value()) {
        return;
    }
    try {
        regex_.emplace(*filter_.keyword);
    } catch (const std::regex_error& e) {
        LOG_DEBUG("LogFilter: keyword '" + *filter_.keyword +
                  "' is not a valid regex (" + e.what() + "), using literal search");
        regex_.reset();
    }
}

bool LogFilterMatcher::matches(const LogEntry& entry) const {
    if (filter_.tool_name.has_value()) {
        const auto name = tool_name(entry);
        if (!name.has_value() || *name != *filter_.tool_name) {
            return false;
        }
    }
    if (filter_.entry_type.has_value() && entry_type(entry) != *filter_.entry_type) {
        return false;
    }
    if (filter_.after.has_value() && entry.timestamp <= *filter_.after) {
        return false;
    }
    if (filter_.before.has_value() && entry.timestamp >= *filter_.before) {
        return false;
    }
    if (filter_.keyword.has_value() && !keyword_matches(entry)) {
        return false;
    }
    return true;
}

bool LogFilterMatcher::keyword_matches(const LogEntry& entry) const {
    const std::string haystack = content_to_json(entry.content).dump();
    if (regex_.has_value() && haystack.size() <= kMaxRegexInput) {
        return std::regex_search(haystack, *regex_);
    }
    return haystack.find(*filter_.keyword) != std::string::npos;
}

}  // namespace wrapmcp::logstore
