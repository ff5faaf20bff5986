#pragma once

#include <lode/criteria.hpp>
#include <cstdint>
#include <optional>

namespace lode {

// Inclusive on both bounds: sizeMax = 0 accepts exactly the empty files.
bool size_in_range(uint64_t size,
                   const std::optional<uint64_t>& min,
                   const std::optional<uint64_t>& max);

// Exclusive on both bounds: after < mtime < before.
bool mtime_in_range(TimePoint mtime,
                    const std::optional<TimePoint>& after,
                    const std::optional<TimePoint>& before);

// Apply the size and date bounds of `criteria` to one file's stat fields.
bool passes_metadata(const SearchCriteria& criteria, uint64_t size, TimePoint mtime);

} // namespace lode
