#include "ManualOverrideParser.hpp"
#include "TextUtils.hpp"

#include <regex>

namespace furigana
{

namespace
{

const std::regex* patternFor(NotationStyle style)
{
    // Compiled patterns are immutable; only the iterators carry scan state
    static const std::regex curly(R"(\{([^{}|\r\n]+)((?:\|[^{}|\r\n]+)+)\})");
    static const std::regex square(R"(\[([^\[\]|\r\n]+)((?:\|[^\[\]|\r\n]+)+)\])");

    switch (style)
    {
    case NotationStyle::Curly:
        return &curly;
    case NotationStyle::Square:
        return &square;
    case NotationStyle::None:
    default:
        return nullptr;
    }
}

std::vector<std::string> splitReadings(const std::string& reading_tail)
{
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos <= reading_tail.size())
    {
        std::size_t next = reading_tail.find('|', pos);
        if (next == std::string::npos)
            next = reading_tail.size();
        parts.push_back(reading_tail.substr(pos, next - pos));
        pos = next + 1;
    }

    // The tail starts with '|', so the first element is always empty
    if (!parts.empty() && parts.front().empty())
        parts.erase(parts.begin());
    return parts;
}

} // namespace

NotationStyle notationStyleFromString(std::string_view name) noexcept
{
    if (name == "curly")
        return NotationStyle::Curly;
    if (name == "square")
        return NotationStyle::Square;
    return NotationStyle::None;
}

const char* notationStyleToString(NotationStyle style) noexcept
{
    switch (style)
    {
    case NotationStyle::Curly:
        return "curly";
    case NotationStyle::Square:
        return "square";
    case NotationStyle::None:
    default:
        return "none";
    }
}

bool isKnownNotationStyle(std::string_view name) noexcept
{
    return name == "curly" || name == "square" || name == "none";
}

std::vector<ManualMatch> findManualOverrides(std::string_view text, NotationStyle style, std::size_t base_offset)
{
    std::vector<ManualMatch> matches;
    const std::regex* pattern = patternFor(style);
    if (!pattern || text.empty())
        return matches;

    const char* begin = text.data();
    std::cregex_iterator iter(begin, begin + text.size(), *pattern);
    std::cregex_iterator end;

    for (; iter != end; ++iter)
    {
        const std::cmatch& m = *iter;
        ManualMatch match;
        match.interval.from = base_offset + static_cast<std::size_t>(m.position(0));
        match.interval.to = match.interval.from + static_cast<std::size_t>(m.length(0));
        match.base = m[1].str();
        match.reading_tail = m[2].str();
        matches.push_back(std::move(match));
    }

    return matches;
}

AlignedSegment alignManualReadings(const std::string& base, const std::string& reading_tail)
{
    AlignedSegment segment;
    const std::vector<std::string> readings = splitReadings(reading_tail);

    if (readings.size() <= 1)
    {
        segment.append(base, readings.empty() ? std::string() : readings.front());
        return segment;
    }

    for (std::string& ch : splitCodePoints(base))
    {
        const std::size_t index = segment.size();
        const std::string& reading = index < readings.size() ? readings[index] : readings.back();
        segment.append(std::move(ch), reading);
    }
    return segment;
}

std::vector<Candidate> parseManualOverrides(std::string_view text, NotationStyle style, std::size_t base_offset)
{
    std::vector<Candidate> candidates;
    for (const auto& match : findManualOverrides(text, style, base_offset))
    {
        candidates.push_back(Candidate{match.interval, alignManualReadings(match.base, match.reading_tail),
                                       Origin::Manual});
    }
    return candidates;
}

} // namespace furigana
