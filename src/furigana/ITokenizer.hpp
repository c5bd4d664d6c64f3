#pragma once

#include "FuriganaTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace furigana
{

/**
 * @brief Abstract interface for morphological tokenizers.
 *
 * Implementations split Japanese text into morphemes and report each one's
 * surface form plus, when the dictionary knows it, its katakana reading.
 *
 * Contract:
 * - Tokens are returned in input order.
 * - Concatenating every surface reproduces the input whenever possible
 *   (whitespace the backend skips should be reported as reading-less tokens).
 * - tokenize() is const and must be safe to call from several threads once the
 *   instance is constructed.
 */
class ITokenizer
{
public:
    virtual ~ITokenizer() = default;

    /**
     * @brief Tokenize a UTF-8 string.
     *
     * @param text Input text
     * @return Ordered morphemes; empty for empty input
     */
    [[nodiscard]] virtual std::vector<Token> tokenize(const std::string& text) const = 0;
};

using TokenizerHandle = std::shared_ptr<const ITokenizer>;

} // namespace furigana
