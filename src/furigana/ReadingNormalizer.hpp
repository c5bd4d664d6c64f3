#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace furigana
{

/// Placeholder the tokenizer uses for "no reading known"
inline constexpr std::string_view kNoReadingSentinel = "*";

/// Katakana code point to its hiragana counterpart; other code points unchanged
[[nodiscard]] char32_t toHiragana(char32_t cp) noexcept;

/// Katakana to hiragana over a UTF-8 string. The prolonged sound mark is kept.
[[nodiscard]] std::string toHiragana(std::string_view text);

/// Canonical hiragana reading for a token. An absent, empty or sentinel
/// reading falls back to the surface form.
[[nodiscard]] std::string normalizeReading(const std::optional<std::string>& raw, std::string_view fallback);

} // namespace furigana
