#include "ScriptClassifier.hpp"
#include "TextUtils.hpp"

#include <cstddef>

namespace furigana {

namespace {

bool isHiragana(char32_t cp)
{
    return cp >= 0x3040u && cp <= 0x309Fu;
}

bool isKatakana(char32_t cp)
{
    return cp >= 0x30A0u && cp <= 0x30FFu;
}

bool isCjkUnified(char32_t cp)
{
    return (cp >= 0x4E00u && cp <= 0x9FFFu) ||
           (cp >= 0x3400u && cp <= 0x4DBFu) ||
           (cp >= 0xF900u && cp <= 0xFAFFu);
}

} // namespace

bool isKanji(char32_t cp) noexcept
{
    return isCjkUnified(cp);
}

bool isKana(char32_t cp) noexcept
{
    // ー (U+30FC) sits inside the katakana block
    return isHiragana(cp) || isKatakana(cp);
}

bool isJapaneseSpanChar(char32_t cp) noexcept
{
    return isHiragana(cp) || isKatakana(cp) || isCjkUnified(cp);
}

bool hasKanji(std::string_view text)
{
    std::size_t index = 0;
    while (index < text.size())
    {
        char32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
        {
            continue;
        }

        if (isKanji(codepoint))
        {
            return true;
        }
    }
    return false;
}

bool ContainsJapaneseText(std::string_view text)
{
    std::size_t index = 0;
    while (index < text.size())
    {
        // Everything we care about is outside ASCII
        if (static_cast<unsigned char>(text[index]) < 0x80u)
        {
            ++index;
            continue;
        }

        char32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
        {
            continue;
        }

        if (isJapaneseSpanChar(codepoint))
        {
            return true;
        }
    }
    return false;
}

} // namespace furigana
