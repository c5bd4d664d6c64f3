#include "FuriganaEngine.hpp"
#include "Diagnostics.hpp"
#include "IntervalResolver.hpp"
#include "ScriptClassifier.hpp"
#include "SegmentBuilder.hpp"
#include "SpanDetector.hpp"
#include "StageRunner.hpp"
#include "TokenizerProvider.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <plog/Log.h>
#include <utility>

namespace furigana
{

namespace
{

void logInput(const char* mode, std::string_view text, const AnnotationOptions& options, bool has_tokenizer)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[FuriganaEngine] mode=" << mode << " notation=" << notationStyleToString(options.notation)
            << " selections=" << options.selections.size() << " tokenizer=" << (has_tokenizer ? "yes" : "no")
            << " input=" << Diagnostics::Preview(text);
}

void logCandidates(const std::vector<Candidate>& manual, const std::vector<Candidate>& automatic,
                   const std::vector<ExclusionZone>& exclusions)
{
    if (!Diagnostics::IsVerbose())
        return;

    PLOG_INFO_(Diagnostics::kLogInstance)
        << "[FuriganaEngine] candidates manual=" << manual.size() << " automatic=" << automatic.size()
        << " exclusions=" << exclusions.size();
}

void logCompletion(const std::vector<ResolvedSpan>& spans)
{
    if (!Diagnostics::IsVerbose())
        return;

    std::ostringstream oss;
    oss << "[FuriganaEngine] stage=complete spans=" << spans.size();
    for (const auto& span : spans)
        oss << " [" << span.interval.from << "," << span.interval.to << ")" << originToString(span.origin)[0];
    PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
}

} // anonymous namespace

FuriganaEngine::FuriganaEngine(TokenizerHandle tokenizer)
    : tokenizer_(std::move(tokenizer))
{
}

FuriganaEngine::FuriganaEngine(const TokenizerProvider* provider)
    : provider_(provider)
{
}

TokenizerHandle FuriganaEngine::currentTokenizer() const
{
    if (provider_)
        return provider_->tokenizer();
    return tokenizer_;
}

std::vector<Candidate> FuriganaEngine::automaticCandidates(std::string_view text, std::size_t base_offset,
                                                           const TokenizerHandle& tokenizer) const
{
    std::vector<Candidate> candidates;
    if (!ContainsJapaneseText(text))
        return candidates;

    SegmentBuilder builder(tokenizer);

    for (const auto& span : detectJapaneseSpans(text, base_offset))
    {
        const std::string run(text.substr(span.from - base_offset, span.length()));
        candidates.push_back(Candidate{span, builder.build(run), Origin::Automatic});
    }
    return candidates;
}

std::vector<ResolvedSpan> FuriganaEngine::annotate(std::string_view text, const AnnotationOptions& options) const
{
    PROFILE_SCOPE_CUSTOM("FuriganaEngine::annotate");

    const TokenizerHandle tokenizer = currentTokenizer();
    logInput("static", text, options, tokenizer != nullptr);

    if (text.empty())
        return {};

    auto manual = takeOrEmpty(
        runStage("manual_overrides", [&] { return parseManualOverrides(text, options.notation); }));

    std::vector<ExclusionZone> exclusions = options.selections;
    if (options.skip_code)
    {
        auto code = collectCodeExclusions(text);
        exclusions.insert(exclusions.end(), code.begin(), code.end());
    }

    auto automatic = takeOrEmpty(runStage("automatic_spans", [&] { return automaticCandidates(text, 0, tokenizer); }));

    logCandidates(manual, automatic, exclusions);

    auto resolved = resolveIntervals(manual, automatic, exclusions);
    logCompletion(resolved);
    return resolved;
}

std::vector<ResolvedSpan> FuriganaEngine::annotateVisible(std::string_view document,
                                                          const std::vector<Interval>& visible_ranges,
                                                          const AnnotationOptions& options) const
{
    PROFILE_SCOPE_CUSTOM("FuriganaEngine::annotateVisible");

    const TokenizerHandle tokenizer = currentTokenizer();
    logInput("viewport", document, options, tokenizer != nullptr);

    if (document.empty() || visible_ranges.empty())
        return {};

    std::vector<Interval> ranges = visible_ranges;
    std::sort(ranges.begin(), ranges.end(),
              [](const Interval& a, const Interval& b) { return a.from < b.from; });

    auto pass = runStage("viewport_pass", [&] {
        const std::vector<TextLine> lines = splitLines(document);
        std::vector<ResolvedSpan> spans;

        // Fence state starts fresh every pass, at the first visible line
        CodeFenceTracker fences;
        std::size_t next_line = 0;

        for (const auto& range : ranges)
        {
            const std::size_t first = std::max(lineIndexAt(lines, range.from), next_line);
            const std::size_t last = lineIndexAt(lines, range.to);

            for (std::size_t n = first; n <= last && n < lines.size(); ++n)
            {
                const TextLine& line = lines[n];
                if (options.skip_code && fences.consume(line.text))
                    continue;

                auto manual = parseManualOverrides(line.text, options.notation, line.from);

                std::vector<ExclusionZone> exclusions = options.selections;
                if (options.skip_code)
                {
                    for (const auto& code : findInlineCodeRanges(line.text, line.from))
                        exclusions.push_back(ExclusionZone{code.from, code.to});
                }

                auto automatic = automaticCandidates(line.text, line.from, tokenizer);
                logCandidates(manual, automatic, exclusions);

                auto resolved = resolveIntervals(manual, automatic, exclusions);
                spans.insert(spans.end(), std::make_move_iterator(resolved.begin()),
                             std::make_move_iterator(resolved.end()));
            }

            next_line = std::max(next_line, last + 1);
        }

        return spans;
    });

    auto spans = takeOrEmpty(std::move(pass));
    logCompletion(spans);
    return spans;
}

} // namespace furigana
