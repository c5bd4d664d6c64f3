#include "TextUtils.hpp"
#include <utf8proc.h>

namespace furigana
{

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());
    std::size_t index = 0;
    while (index < utf8_str.size())
    {
        char32_t codepoint = 0;
        if (decodeNextUtf8(utf8_str, index, codepoint))
            result.push_back(codepoint);
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size() * 3);
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(bytes));
        }
    }
    return result;
}

std::string utf32ToUtf8(char32_t cp)
{
    return utf32ToUtf8(std::u32string(1, cp));
}

bool decodeNextUtf8(std::string_view text, std::size_t& index, char32_t& codepoint)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data()) + index;
    const auto remaining = static_cast<utf8proc_ssize_t>(text.size() - index);

    utf8proc_int32_t decoded = -1;
    utf8proc_ssize_t bytes = utf8proc_iterate(str, remaining, &decoded);
    if (bytes <= 0 || decoded < 0)
    {
        ++index;
        return false;
    }

    codepoint = static_cast<char32_t>(decoded);
    index += static_cast<std::size_t>(bytes);
    return true;
}

std::vector<std::string> splitCodePoints(std::string_view utf8_str)
{
    std::vector<std::string> chars;
    std::size_t index = 0;
    while (index < utf8_str.size())
    {
        std::size_t start = index;
        char32_t codepoint = 0;
        decodeNextUtf8(utf8_str, index, codepoint);
        // Malformed bytes are kept as their own chunk so nothing is lost
        chars.emplace_back(utf8_str.substr(start, index - start));
    }
    return chars;
}

std::string escapeHtml(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        switch (ch)
        {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
    return out;
}

} // namespace furigana
