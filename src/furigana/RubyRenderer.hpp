#pragma once

#include "FuriganaTypes.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace furigana
{

/// <ruby class="furi"> with an explicit <rb>/<rt> per chunk. Chunks without
/// kanji get an empty <rt> so rb/rt pairs stay aligned.
[[nodiscard]] std::string renderRubyHtml(const AlignedSegment& segment);

/// Editor widget markup: a <span> holding plain text for kana chunks and, for
/// kanji chunks, the chunk's own leading/trailing kana as text around a
/// <ruby> for the kanji core.
[[nodiscard]] std::string renderWidgetHtml(const AlignedSegment& segment);

struct HtmlFragment
{
    std::string html;
    bool changed = false;   // false: nothing became ruby, keep the original text
};

/// Static conversion: escape the text and replace every span. Manual spans
/// always become ruby; automatic spans only when they contain kanji.
[[nodiscard]] HtmlFragment convertToHtml(std::string_view text, const std::vector<ResolvedSpan>& spans);

struct Decoration
{
    std::size_t from = 0;
    std::size_t to = 0;
    std::string html;
};

/// Viewport conversion: one replace-widget per span, in span order
[[nodiscard]] std::vector<Decoration> buildDecorations(const std::vector<ResolvedSpan>& spans);

} // namespace furigana
