#pragma once

#include <lode/result.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lode {

using TimePoint = std::chrono::system_clock::time_point;

// A date filter bound. `text` is what the caller wrote and is echoed in the
// criteria description; `at` is UTC midnight of that day.
struct DateBound {
    std::string text;
    TimePoint at;
};

// Parse "YYYY-MM-DD" into a DateBound. Rejects malformed strings and
// impossible calendar days (2024-02-30). Days beyond the range of
// TimePoint (roughly 1678..2261 for nanosecond clocks) clamp to
// TimePoint::min() or TimePoint::max().
Result<DateBound> parse_iso_date(const std::string& text);

// Parse a decimal size given as text (command line, query string) for the
// request field `name`. Rejects trailing junk and values that do not fit
// in 64 bits; the sign is checked later by from_request().
Result<int64_t> parse_size_arg(const std::string& name, const std::string& text);

// Request as handed over by the outer tool layer: every field optional,
// nothing validated yet.
struct SearchRequest {
    std::optional<std::string> content_pattern;
    std::optional<bool> case_sensitive;
    std::optional<std::string> resource_pattern;
    std::optional<std::string> date_after;
    std::optional<std::string> date_before;
    std::optional<int64_t> size_min;
    std::optional<int64_t> size_max;
};

// Validated, immutable search criteria. An absent field imposes no constraint.
struct SearchCriteria {
    std::optional<std::string> content_pattern;
    bool case_sensitive = false;
    std::optional<std::string> resource_pattern;
    std::optional<DateBound> date_after;
    std::optional<DateBound> date_before;
    std::optional<uint64_t> size_min;
    std::optional<uint64_t> size_max;

    static Result<SearchCriteria> from_request(const SearchRequest& req);
};

} // namespace lode
