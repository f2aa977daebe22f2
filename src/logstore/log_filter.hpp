#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include "logstore/log_entry.hpp"

namespace wrapmcp::logstore {

// Every present field must match; absent fields match everything.
struct LogFilter {
    std::optional<std::string> tool_name;
    std::optional<EntryType> entry_type;
    // Regex over the serialized content. Literal when not a valid pattern or
    // when the content is longer than the regex input limit.
    std::optional<std::string> keyword;
    std::optional<Timestamp> after;
    std::optional<Timestamp> before;
};

class LogFilterMatcher {
public:
    // libstdc++ regex matching recurses per repeated character, so longer
    // entries are only searched literally.
    static constexpr std::size_t kMaxRegexInput = 4096;

    explicit LogFilterMatcher(LogFilter filter);

    bool matches(const LogEntry& entry) const;
    bool keyword_is_regex() const { return regex_.has_value(); }

private:
    bool keyword_matches(const LogEntry& entry) const;

    LogFilter filter_;
    std::optional<std::regex> regex_;
};

}  // namespace wrapmcp::logstore
