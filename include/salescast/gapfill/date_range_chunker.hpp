#pragma once

#include "salescast/core/date.hpp"
#include "salescast/core/period.hpp"

#include <vector>

namespace salescast::gapfill {

/**
 * @brief Groups dates into maximal runs of consecutive days.
 *
 * Dates may arrive in any order; duplicates are ignored. The chunks are
 * returned in ascending order, are pairwise disjoint, and together cover
 * exactly the input dates.
 *
 * @param dates Dates to group.
 * @param max_chunk_days Longest chunk emitted; longer runs are split into
 *        consecutive pieces. 0 keeps every run whole.
 * @throws std::invalid_argument If @p max_chunk_days is negative.
 */
std::vector<core::Period> chunkContiguous(std::vector<core::Date> dates, int max_chunk_days = 0);

/// Dates of @p period that are not in @p present, ascending.
std::vector<core::Date> missingDates(const core::Period &period, const std::vector<core::Date> &present);

} // namespace salescast::gapfill
