#include <lode/metadata_filter.hpp>

namespace lode {

bool size_in_range(uint64_t size,
                   const std::optional<uint64_t>& min,
                   const std::optional<uint64_t>& max) {
    if (min.has_value() && size < *min) return false;
    if (max.has_value() && size > *max) return false;
    return true;
}

bool mtime_in_range(TimePoint mtime,
                    const std::optional<TimePoint>& after,
                    const std::optional<TimePoint>& before) {
    if (after.has_value() && !(*after < mtime)) return false;
    if (before.has_value() && !(mtime < *before)) return false;
    return true;
}

bool passes_metadata(const SearchCriteria& criteria, uint64_t size, TimePoint mtime) {
    if (!size_in_range(size, criteria.size_min, criteria.size_max)) return false;

    std::optional<TimePoint> after;
    std::optional<TimePoint> before;
    if (criteria.date_after.has_value()) after = criteria.date_after->at;
    if (criteria.date_before.has_value()) before = criteria.date_before->at;
    return mtime_in_range(mtime, after, before);
}

} // namespace lode
