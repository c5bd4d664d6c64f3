#include "ReadingNormalizer.hpp"
#include "TextUtils.hpp"

#include <cstdlib>
#include <utf8proc.h>
#include <plog/Log.h>

namespace furigana
{

namespace
{

// Half-width katakana readings occasionally come out of user dictionaries
std::string nfkc(const std::string& text)
{
    utf8proc_uint8_t* normalized = utf8proc_NFKC(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()));
    if (!normalized)
    {
        PLOG_WARNING << "NFKC normalization failed for reading, using it unchanged";
        return text;
    }

    std::string out(reinterpret_cast<char*>(normalized));
    std::free(normalized);
    return out;
}

} // namespace

char32_t toHiragana(char32_t cp) noexcept
{
    // ァ..ヶ and the iteration marks ヽヾ sit exactly 0x60 above their hiragana forms
    if ((cp >= 0x30A1u && cp <= 0x30F6u) || cp == 0x30FDu || cp == 0x30FEu)
        return cp - 0x60u;
    return cp;
}

std::string toHiragana(std::string_view text)
{
    if (text.empty())
        return std::string();

    std::string out;
    out.reserve(text.size());

    std::size_t index = 0;
    while (index < text.size())
    {
        std::size_t start = index;
        char32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
        {
            out.append(text.substr(start, index - start));
            continue;
        }

        char32_t mapped = toHiragana(codepoint);
        if (mapped == codepoint)
            out.append(text.substr(start, index - start));
        else
            out += utf32ToUtf8(mapped);
    }
    return out;
}

std::string normalizeReading(const std::optional<std::string>& raw, std::string_view fallback)
{
    if (!raw || raw->empty() || *raw == kNoReadingSentinel)
        return toHiragana(fallback);

    return toHiragana(nfkc(*raw));
}

} // namespace furigana
