#pragma once

#include "FuriganaTypes.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace furigana
{

/**
 * @brief Bracket notation used for inline reading overrides.
 */
enum class NotationStyle
{
    Curly,  // {漢字|かん|じ}
    Square, // [漢字|かん|じ]
    None    // overrides disabled, nothing ever matches
};

/// Unknown names map to NotationStyle::None
[[nodiscard]] NotationStyle notationStyleFromString(std::string_view name) noexcept;
[[nodiscard]] const char* notationStyleToString(NotationStyle style) noexcept;
[[nodiscard]] bool isKnownNotationStyle(std::string_view name) noexcept;

/**
 * @brief One textual override occurrence.
 *
 * Grammar (per style, OPEN/CLOSE being the bracket pair):
 *   OPEN base ( '|' reading )+ CLOSE
 * where base and every reading are non-empty and contain neither bracket
 * character, '|', '\r' nor '\n'.
 *
 * `base` is capture group 1; `reading_tail` is capture group 2, the complete
 * pipe-delimited tail including its leading '|' (e.g. "|かん|じ").
 */
struct ManualMatch
{
    Interval interval;          // Whole markup, brackets included
    std::string base;
    std::string reading_tail;
};

/**
 * @brief Find every override in `text`, left to right, non-overlapping.
 *
 * A fresh matcher is used per call; nothing is shared between callers.
 *
 * @param text        Text to scan
 * @param style       Notation to recognize
 * @param base_offset Added to every reported interval (line start in a document)
 */
[[nodiscard]] std::vector<ManualMatch> findManualOverrides(std::string_view text, NotationStyle style,
                                                           std::size_t base_offset = 0);

/**
 * @brief Distribute the readings of one override over its base.
 *
 * - one reading: the whole base maps to it
 * - several readings: the base is split per character; character i takes
 *   reading i, and characters past the last supplied reading repeat it
 */
[[nodiscard]] AlignedSegment alignManualReadings(const std::string& base, const std::string& reading_tail);

/// findManualOverrides + alignManualReadings, as Manual-origin candidates
[[nodiscard]] std::vector<Candidate> parseManualOverrides(std::string_view text, NotationStyle style,
                                                          std::size_t base_offset = 0);

} // namespace furigana
