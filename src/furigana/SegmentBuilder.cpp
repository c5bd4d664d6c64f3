#include "SegmentBuilder.hpp"
#include "Diagnostics.hpp"
#include "OkuriganaSplitter.hpp"
#include "ReadingNormalizer.hpp"
#include "ScriptClassifier.hpp"

#include <plog/Log.h>
#include <utility>

namespace furigana
{

SegmentBuilder::SegmentBuilder(TokenizerHandle tokenizer)
    : tokenizer_(std::move(tokenizer))
{
}

std::vector<Token> SegmentBuilder::tokenize(const std::string& text) const
{
    if (!tokenizer_)
        return {Token{text, std::nullopt}};

    return tokenizer_->tokenize(text);
}

AlignedSegment SegmentBuilder::build(const std::string& text) const
{
    AlignedSegment segment;
    if (text.empty())
        return segment;

    for (const auto& token : tokenize(text))
    {
        if (token.surface.empty())
            continue;

        std::string reading = normalizeReading(token.reading, token.surface);

        // Kana-only or symbol tokens pass through so the arrays stay aligned
        if (!hasKanji(token.surface))
        {
            segment.append(token.surface, std::move(reading));
            continue;
        }

        OkuriganaSplit split = splitOkurigana(token.surface, reading);
        if (!split.prefix.base.empty())
            segment.append(std::move(split.prefix.base), std::move(split.prefix.reading));
        if (!split.base.empty())
            segment.append(std::move(split.base), split.base_reading.empty() ? reading : std::move(split.base_reading));
        if (!split.suffix.base.empty())
            segment.append(std::move(split.suffix.base), std::move(split.suffix.reading));
    }

    if (segment.empty())
    {
        if (Diagnostics::IsVerbose())
            PLOG_WARNING_(Diagnostics::kLogInstance)
                << "[SegmentBuilder] no chunks emitted, falling back to whole input=" << Diagnostics::Preview(text);
        segment.append(text, normalizeReading(std::nullopt, text));
    }

    return segment;
}

} // namespace furigana
