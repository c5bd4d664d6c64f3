#pragma once

#include "FuriganaTypes.hpp"
#include "ITokenizer.hpp"
#include "ManualOverrideParser.hpp"

#include <string_view>
#include <vector>

namespace furigana
{

class TokenizerProvider;

struct AnnotationOptions
{
    NotationStyle notation = NotationStyle::Curly;
    std::vector<ExclusionZone> selections;   // Active selections and carets; empty means none
    bool skip_code = true;                   // Leave inline code and fenced blocks alone
};

/**
 * @brief Computes the replacement spans for a text.
 *
 * Two entry points share one pipeline (manual overrides, automatic Japanese
 * runs, code and selection exclusions, resolution):
 *  - annotate():        the whole text at once (static conversion)
 *  - annotateVisible(): only the lines touched by the visible ranges of a
 *                       document (editor viewport); called again from scratch
 *                       after every edit, scroll or selection change
 *
 * Every call is independent: no matcher or scan state survives it, so the
 * same input always produces the same spans.
 */
class FuriganaEngine
{
public:
    /// No tokenizer: each run is one unread token, split around its kana
    FuriganaEngine() = default;

    /// Fixed tokenizer handle
    explicit FuriganaEngine(TokenizerHandle tokenizer);

    /// Tokenizer looked up from the provider on every call, so a build that
    /// finishes later is picked up without recreating the engine
    explicit FuriganaEngine(const TokenizerProvider* provider);

    [[nodiscard]] std::vector<ResolvedSpan> annotate(std::string_view text,
                                                     const AnnotationOptions& options = {}) const;

    [[nodiscard]] std::vector<ResolvedSpan> annotateVisible(std::string_view document,
                                                            const std::vector<Interval>& visible_ranges,
                                                            const AnnotationOptions& options = {}) const;

private:
    TokenizerHandle currentTokenizer() const;

    std::vector<Candidate> automaticCandidates(std::string_view text, std::size_t base_offset,
                                               const TokenizerHandle& tokenizer) const;

    TokenizerHandle tokenizer_;
    const TokenizerProvider* provider_ = nullptr;
};

} // namespace furigana
