#include "SpanDetector.hpp"
#include "ScriptClassifier.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <iterator>

namespace furigana
{

namespace
{

std::string_view trimmed(std::string_view line) noexcept
{
    constexpr std::string_view whitespace = " \t\r\f\v";
    const std::size_t first = line.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
        return std::string_view();
    const std::size_t last = line.find_last_not_of(whitespace);
    return line.substr(first, last - first + 1);
}

} // namespace

std::vector<TextLine> splitLines(std::string_view text)
{
    std::vector<TextLine> lines;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t brk = text.find('\n', start);
        if (brk == std::string_view::npos)
        {
            lines.push_back(TextLine{start, text.size(), text.substr(start)});
            break;
        }
        lines.push_back(TextLine{start, brk, text.substr(start, brk - start)});
        start = brk + 1;
    }
    return lines;
}

std::size_t lineIndexAt(const std::vector<TextLine>& lines, std::size_t offset) noexcept
{
    if (lines.empty())
        return 0;

    // First line starting after offset, then step back one
    auto it = std::upper_bound(lines.begin(), lines.end(), offset,
                               [](std::size_t value, const TextLine& line) { return value < line.from; });
    if (it == lines.begin())
        return 0;
    return static_cast<std::size_t>(std::distance(lines.begin(), it)) - 1;
}

std::vector<Interval> detectJapaneseSpans(std::string_view text, std::size_t base_offset)
{
    std::vector<Interval> spans;
    bool in_run = false;
    std::size_t run_start = 0;

    std::size_t index = 0;
    while (index < text.size())
    {
        const std::size_t start = index;
        char32_t codepoint = 0;
        const bool valid = decodeNextUtf8(text, index, codepoint);

        if (valid && isJapaneseSpanChar(codepoint))
        {
            if (!in_run)
            {
                in_run = true;
                run_start = start;
            }
            continue;
        }

        if (in_run)
        {
            spans.push_back(Interval{base_offset + run_start, base_offset + start});
            in_run = false;
        }
    }

    if (in_run)
        spans.push_back(Interval{base_offset + run_start, base_offset + text.size()});

    return spans;
}

std::vector<Interval> findInlineCodeRanges(std::string_view line, std::size_t base_offset)
{
    std::vector<Interval> ranges;
    bool open = false;
    std::size_t open_at = 0;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] != '`')
            continue;

        if (!open)
        {
            open = true;
            open_at = i;
        }
        else
        {
            ranges.push_back(Interval{base_offset + open_at, base_offset + i + 1});
            open = false;
        }
    }

    return ranges;
}

CodeFenceTracker::CodeFenceTracker(std::string_view marker) noexcept
    : marker_(marker)
{
}

bool CodeFenceTracker::consume(std::string_view line) noexcept
{
    const std::string_view content = trimmed(line);
    if (!marker_.empty() && content.substr(0, marker_.size()) == marker_)
    {
        inside_ = !inside_;
        return true;
    }
    return inside_;
}

std::vector<ExclusionZone> collectCodeExclusions(std::string_view text)
{
    std::vector<ExclusionZone> zones;
    CodeFenceTracker fences;

    for (const auto& line : splitLines(text))
    {
        if (fences.consume(line.text))
        {
            if (line.to > line.from)
                zones.push_back(ExclusionZone{line.from, line.to});
            continue;
        }

        for (const auto& range : findInlineCodeRanges(line.text, line.from))
            zones.push_back(ExclusionZone{range.from, range.to});
    }

    return zones;
}

} // namespace furigana
