#include "RubyRenderer.hpp"
#include "ScriptClassifier.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace furigana
{

namespace
{

struct ChunkParts
{
    std::string lead;
    std::string core;
    std::string tail;
};

// Peel the non-kanji code points off both ends of a chunk
ChunkParts splitChunk(std::string_view chunk)
{
    const std::u32string cps = utf8ToUtf32(chunk);

    std::size_t first = 0;
    while (first < cps.size() && !isKanji(cps[first]))
        ++first;

    std::size_t last = cps.size();
    while (last > first && !isKanji(cps[last - 1]))
        --last;

    ChunkParts parts;
    parts.lead = utf32ToUtf8(cps.substr(0, first));
    parts.core = utf32ToUtf8(cps.substr(first, last - first));
    parts.tail = utf32ToUtf8(cps.substr(last));
    return parts;
}

std::string stripReading(const std::string& reading, const ChunkParts& parts)
{
    std::string_view view(reading);
    if (!parts.lead.empty() && view.substr(0, parts.lead.size()) == parts.lead)
        view.remove_prefix(parts.lead.size());
    if (!parts.tail.empty() && view.size() >= parts.tail.size() &&
        view.substr(view.size() - parts.tail.size()) == parts.tail)
        view.remove_suffix(parts.tail.size());

    if (view.empty())
        return reading;
    return std::string(view);
}

bool segmentHasKanji(const AlignedSegment& segment)
{
    return std::any_of(segment.base_chunks.begin(), segment.base_chunks.end(),
                       [](const std::string& chunk) { return hasKanji(chunk); });
}

} // namespace

std::string renderRubyHtml(const AlignedSegment& segment)
{
    std::string html = "<ruby class=\"furi\">";
    for (std::size_t i = 0; i < segment.size(); ++i)
    {
        const std::string& base = segment.base_chunks[i];
        html += "<rb>" + escapeHtml(base) + "</rb><rt>";
        if (hasKanji(base))
            html += escapeHtml(segment.reading_chunks[i]);
        html += "</rt>";
    }
    html += "</ruby>";
    return html;
}

std::string renderWidgetHtml(const AlignedSegment& segment)
{
    std::string html = "<span class=\"furi-widget\">";
    for (std::size_t i = 0; i < segment.size(); ++i)
    {
        const std::string& base = segment.base_chunks[i];
        if (!hasKanji(base))
        {
            html += escapeHtml(base);
            continue;
        }

        const ChunkParts parts = splitChunk(base);
        html += escapeHtml(parts.lead);
        html += "<ruby class=\"furi\">" + escapeHtml(parts.core) + "<rt>" +
                escapeHtml(stripReading(segment.reading_chunks[i], parts)) + "</rt></ruby>";
        html += escapeHtml(parts.tail);
    }
    html += "</span>";
    return html;
}

HtmlFragment convertToHtml(std::string_view text, const std::vector<ResolvedSpan>& spans)
{
    HtmlFragment fragment;
    std::size_t cursor = 0;

    for (const auto& span : spans)
    {
        if (span.interval.from < cursor || span.interval.to > text.size())
            continue;

        fragment.html += escapeHtml(text.substr(cursor, span.interval.from - cursor));

        if (span.origin == Origin::Manual || segmentHasKanji(span.segment))
        {
            fragment.html += renderRubyHtml(span.segment);
            fragment.changed = true;
        }
        else
        {
            // Kana-only automatic run: same text, nothing to annotate
            fragment.html += escapeHtml(text.substr(span.interval.from, span.interval.length()));
        }
        cursor = span.interval.to;
    }

    fragment.html += escapeHtml(text.substr(cursor));
    return fragment;
}

std::vector<Decoration> buildDecorations(const std::vector<ResolvedSpan>& spans)
{
    std::vector<Decoration> decorations;
    decorations.reserve(spans.size());
    for (const auto& span : spans)
        decorations.push_back(Decoration{span.interval.from, span.interval.to, renderWidgetHtml(span.segment)});
    return decorations;
}

} // namespace furigana
