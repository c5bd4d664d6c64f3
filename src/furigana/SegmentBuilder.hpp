#pragma once

#include "FuriganaTypes.hpp"
#include "ITokenizer.hpp"

#include <string>

namespace furigana
{

/// Turns a Japanese string into one aligned (base, reading) segment using the
/// tokenizer it was given. A null tokenizer treats the whole input as one
/// token with no reading, which still goes through okurigana splitting.
class SegmentBuilder
{
public:
    explicit SegmentBuilder(TokenizerHandle tokenizer = nullptr);

    [[nodiscard]] AlignedSegment build(const std::string& text) const;

    [[nodiscard]] bool hasTokenizer() const noexcept { return tokenizer_ != nullptr; }

private:
    std::vector<Token> tokenize(const std::string& text) const;

    TokenizerHandle tokenizer_;
};

} // namespace furigana
