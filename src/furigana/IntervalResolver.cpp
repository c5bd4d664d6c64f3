#include "IntervalResolver.hpp"

#include <algorithm>
#include <utility>

namespace furigana
{

namespace
{

bool overlapsAnyCandidate(const Interval& interval, const std::vector<Candidate>& candidates) noexcept
{
    return std::any_of(candidates.begin(), candidates.end(),
                       [&](const Candidate& c) { return interval.overlaps(c.interval.from, c.interval.to); });
}

ResolvedSpan toResolved(const Candidate& candidate)
{
    return ResolvedSpan{candidate.interval, candidate.segment, candidate.origin};
}

} // namespace

bool overlapsAny(const Interval& interval, const std::vector<ExclusionZone>& zones) noexcept
{
    return std::any_of(zones.begin(), zones.end(),
                       [&](const ExclusionZone& z) { return interval.overlaps(z.from, z.to); });
}

std::vector<ResolvedSpan> resolveIntervals(const std::vector<Candidate>& manual,
                                           const std::vector<Candidate>& automatic,
                                           const std::vector<ExclusionZone>& exclusions)
{
    std::vector<ResolvedSpan> resolved;
    resolved.reserve(manual.size() + automatic.size());

    for (const auto& candidate : manual)
    {
        if (overlapsAny(candidate.interval, exclusions))
            continue;
        resolved.push_back(toResolved(candidate));
    }

    for (const auto& candidate : automatic)
    {
        if (overlapsAny(candidate.interval, exclusions))
            continue;
        if (overlapsAnyCandidate(candidate.interval, manual))
            continue;
        resolved.push_back(toResolved(candidate));
    }

    std::stable_sort(resolved.begin(), resolved.end(),
                     [](const ResolvedSpan& a, const ResolvedSpan& b)
                     {
                         if (a.interval.from != b.interval.from)
                             return a.interval.from < b.interval.from;
                         return a.interval.to < b.interval.to;
                     });

    // Only reachable when a caller hands in candidates that overlap among
    // themselves; the first in order wins so the output stays a valid range set
    auto last_kept = resolved.end();
    auto out = resolved.begin();
    for (auto it = resolved.begin(); it != resolved.end(); ++it)
    {
        if (last_kept != resolved.end() && it->interval.from < last_kept->interval.to)
            continue;
        if (out != it)
            *out = std::move(*it);
        last_kept = out;
        ++out;
    }
    resolved.erase(out, resolved.end());

    return resolved;
}

} // namespace furigana
