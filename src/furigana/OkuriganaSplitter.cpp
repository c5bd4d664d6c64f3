#include "OkuriganaSplitter.hpp"
#include "ReadingNormalizer.hpp"
#include "ScriptClassifier.hpp"
#include "TextUtils.hpp"

namespace furigana
{

namespace
{

bool startsWith(const std::u32string& text, char32_t cp)
{
    return !text.empty() && text.front() == cp;
}

bool endsWith(const std::u32string& text, char32_t cp)
{
    return !text.empty() && text.back() == cp;
}

} // namespace

OkuriganaSplit splitOkurigana(std::string_view surface, std::string_view reading_hira)
{
    const std::u32string chars = utf8ToUtf32(surface);
    std::u32string reading = utf8ToUtf32(reading_hira);

    std::u32string prefix_base;
    std::u32string prefix_reading;
    std::size_t i = 0;
    while (i < chars.size())
    {
        const char32_t ch = chars[i];
        if (!isKana(ch))
            break;
        const char32_t h = toHiragana(ch);
        if (!startsWith(reading, h))
            break;
        prefix_base.push_back(ch);
        prefix_reading.push_back(h);
        reading.erase(0, 1);
        ++i;
    }

    // Walk backwards; j is one past the last unclaimed character
    std::u32string suffix_base;
    std::u32string suffix_reading;
    std::size_t j = chars.size();
    while (j > i)
    {
        const char32_t ch = chars[j - 1];
        if (!isKana(ch))
            break;
        const char32_t h = toHiragana(ch);
        if (!endsWith(reading, h))
            break;
        suffix_base.insert(suffix_base.begin(), ch);
        suffix_reading.insert(suffix_reading.begin(), h);
        reading.pop_back();
        --j;
    }

    OkuriganaSplit split;
    split.base = utf32ToUtf8(chars.substr(i, j - i));
    split.base_reading = utf32ToUtf8(reading);
    split.prefix = {utf32ToUtf8(prefix_base), utf32ToUtf8(prefix_reading)};
    split.suffix = {utf32ToUtf8(suffix_base), utf32ToUtf8(suffix_reading)};
    return split;
}

} // namespace furigana
