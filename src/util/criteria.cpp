#include <lode/criteria.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace lode {

namespace {

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return table[m - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's
// days_from_civil).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

// Days past what the clock can hold saturate to its min/max.
TimePoint midnight_utc(int64_t days) {
    using std::chrono::seconds;
    const int64_t secs = days * 86400;
    const auto lo = std::chrono::duration_cast<seconds>(TimePoint::duration::min()).count();
    const auto hi = std::chrono::duration_cast<seconds>(TimePoint::duration::max()).count();
    if (secs <= lo) return TimePoint::min();
    if (secs >= hi) return TimePoint::max();
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(seconds(secs)));
}

bool parse_digits(const std::string& s, size_t pos, size_t len, int& out) {
    out = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

Result<std::optional<uint64_t>> parse_size(const std::optional<int64_t>& v,
                                           const char* field) {
    if (!v.has_value()) {
        return Result<std::optional<uint64_t>>::ok(std::nullopt);
    }
    if (*v < 0) {
        return LodeError{LodeError::InvalidArg,
            std::string(field) + " must not be negative (got " +
            std::to_string(*v) + ")"};
    }
    return Result<std::optional<uint64_t>>::ok(static_cast<uint64_t>(*v));
}

Result<std::optional<DateBound>> parse_date_field(
    const std::optional<std::string>& v, const char* field) {
    if (!v.has_value() || v->empty()) {
        return Result<std::optional<DateBound>>::ok(std::nullopt);
    }
    auto parsed = parse_iso_date(*v);
    if (parsed.is_err()) {
        auto err = std::move(parsed).error();
        err.message = std::string(field) + ": " + err.message;
        return err;
    }
    return Result<std::optional<DateBound>>::ok(std::move(parsed).value());
}

} // namespace

Result<DateBound> parse_iso_date(const std::string& text) {
    int y = 0, m = 0, d = 0;
    bool shape_ok = text.size() == 10 && text[4] == '-' && text[7] == '-' &&
                    parse_digits(text, 0, 4, y) &&
                    parse_digits(text, 5, 2, m) &&
                    parse_digits(text, 8, 2, d);
    if (!shape_ok) {
        return LodeError{LodeError::InvalidArg,
            "invalid date '" + text + "'",
            "dates must be in YYYY-MM-DD format"};
    }
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        return LodeError{LodeError::InvalidArg,
            "invalid date '" + text + "': no such calendar day"};
    }

    auto days = days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
    DateBound bound;
    bound.text = text;
    bound.at = midnight_utc(days);
    return Result<DateBound>::ok(std::move(bound));
}

Result<int64_t> parse_size_arg(const std::string& name, const std::string& text) {
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0') {
        return LodeError{LodeError::InvalidArg,
            name + " expects an integer, got '" + text + "'"};
    }
    if (errno == ERANGE) {
        return LodeError{LodeError::InvalidArg,
            name + " is out of range: " + text};
    }
    return Result<int64_t>::ok(static_cast<int64_t>(v));
}

Result<SearchCriteria> SearchCriteria::from_request(const SearchRequest& req) {
    SearchCriteria c;

    // Empty strings count as "not supplied", matching how the tool layer
    // treats falsy values.
    if (req.content_pattern.has_value() && !req.content_pattern->empty()) {
        c.content_pattern = req.content_pattern;
    }
    c.case_sensitive = req.case_sensitive.value_or(false);
    if (req.resource_pattern.has_value() && !req.resource_pattern->empty()) {
        c.resource_pattern = req.resource_pattern;
    }

    auto after = parse_date_field(req.date_after, "dateAfter");
    if (after.is_err()) return std::move(after).error();
    c.date_after = std::move(after).value();

    auto before = parse_date_field(req.date_before, "dateBefore");
    if (before.is_err()) return std::move(before).error();
    c.date_before = std::move(before).value();

    auto min = parse_size(req.size_min, "sizeMin");
    if (min.is_err()) return std::move(min).error();
    c.size_min = min.value();

    auto max = parse_size(req.size_max, "sizeMax");
    if (max.is_err()) return std::move(max).error();
    c.size_max = max.value();

    return Result<SearchCriteria>::ok(std::move(c));
}

} // namespace lode
