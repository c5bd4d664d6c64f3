#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace furigana
{

/// UTF-8 to UTF-32 conversion (invalid sequences are dropped)
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// UTF-8 encoding of a single code point
std::string utf32ToUtf8(char32_t cp);

/// Decode the code point starting at byte `index` and advance `index` past it.
/// On a malformed sequence `index` moves forward by one byte and false is returned.
bool decodeNextUtf8(std::string_view text, std::size_t& index, char32_t& codepoint);

/// Split a UTF-8 string into one string per code point
std::vector<std::string> splitCodePoints(std::string_view utf8_str);

/// Minimal HTML escaping for text and attribute content
std::string escapeHtml(std::string_view text);

} // namespace furigana
