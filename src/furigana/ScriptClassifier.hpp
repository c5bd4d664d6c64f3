#pragma once

#include <string_view>

namespace furigana {

// CJK Unified Ideographs (incl. ext A) and the compatibility block
[[nodiscard]] bool isKanji(char32_t cp) noexcept;

// Hiragana and katakana blocks, including the prolonged sound mark
[[nodiscard]] bool isKana(char32_t cp) noexcept;

// Code points that belong to an automatically annotated Japanese run
[[nodiscard]] bool isJapaneseSpanChar(char32_t cp) noexcept;

[[nodiscard]] bool hasKanji(std::string_view text);

// Cheap early-exit test used before a block is scanned in detail
[[nodiscard]] bool ContainsJapaneseText(std::string_view text);

} // namespace furigana
