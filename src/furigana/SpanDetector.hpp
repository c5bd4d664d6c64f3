#pragma once

#include "FuriganaTypes.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace furigana
{

inline constexpr std::string_view kCodeFenceMarker = "```";

struct TextLine
{
    std::size_t from = 0;       // Offset of the first byte of the line
    std::size_t to = 0;         // Offset just before the line break
    std::string_view text;      // Line content without the break
};

/// Split on '\n' (a trailing '\r' stays part of the line). Always yields at
/// least one line, so an empty document has one empty line.
[[nodiscard]] std::vector<TextLine> splitLines(std::string_view text);

/// Index of the line containing `offset` (offsets past the end map to the last line)
[[nodiscard]] std::size_t lineIndexAt(const std::vector<TextLine>& lines, std::size_t offset) noexcept;

/// Maximal runs of hiragana, katakana, kanji and ー, as byte intervals
[[nodiscard]] std::vector<Interval> detectJapaneseSpans(std::string_view text, std::size_t base_offset = 0);

/// Backtick-delimited inline code on a single line; an unmatched backtick opens nothing
[[nodiscard]] std::vector<Interval> findInlineCodeRanges(std::string_view line, std::size_t base_offset = 0);

/**
 * @brief Line-by-line fenced code block tracker.
 *
 * Each line whose trimmed content begins with the fence marker flips the
 * "inside fence" flag. The marker lines themselves count as code. One tracker
 * serves one pass; start a new one for every recomputation.
 */
class CodeFenceTracker
{
public:
    explicit CodeFenceTracker(std::string_view marker = kCodeFenceMarker) noexcept;

    /// Feed the next line; returns true if the line is part of a fenced block
    bool consume(std::string_view line) noexcept;

    [[nodiscard]] bool insideFence() const noexcept { return inside_; }

private:
    std::string_view marker_;
    bool inside_ = false;
};

/**
 * @brief Code regions of a whole text: fenced lines and inline code spans.
 *
 * Fenced lines are reported as one zone per line covering the line content.
 */
[[nodiscard]] std::vector<ExclusionZone> collectCodeExclusions(std::string_view text);

} // namespace furigana
