#pragma once

#include "FuriganaTypes.hpp"

#include <vector>

namespace furigana
{

/**
 * @brief Arbitrate candidates into the final replacement list.
 *
 * Per candidate, independently:
 *  1. anything overlapping an exclusion zone is dropped, whatever its origin;
 *  2. an automatic candidate overlapping any manual candidate is dropped
 *     (including a manual candidate that step 1 removed, so the markup under
 *     an active selection stays raw);
 *  3. survivors are ordered by ascending `from`, then `to`.
 *
 * Manual candidates come from non-overlapping matches and automatic ones from
 * non-overlapping runs, so the output never overlaps.
 */
[[nodiscard]] std::vector<ResolvedSpan> resolveIntervals(const std::vector<Candidate>& manual,
                                                         const std::vector<Candidate>& automatic,
                                                         const std::vector<ExclusionZone>& exclusions);

[[nodiscard]] bool overlapsAny(const Interval& interval, const std::vector<ExclusionZone>& zones) noexcept;

} // namespace furigana
