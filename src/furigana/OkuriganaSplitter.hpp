#pragma once

#include <string>
#include <string_view>

namespace furigana
{

struct KanaAffix
{
    std::string base;
    std::string reading;
};

struct OkuriganaSplit
{
    std::string base;           // Kanji core (whatever the kana walks left behind)
    std::string base_reading;   // Reading left after both affixes were stripped; may be empty
    KanaAffix prefix;           // Leading kana matched against the start of the reading
    KanaAffix suffix;           // Trailing kana matched against the end of the reading
};

/**
 * @brief Split a token's surface into [prefix kana][kanji core][suffix kana].
 *
 * Leading kana are consumed while the reading starts with their hiragana form,
 * then trailing kana (never crossing the prefix) while the reading ends with
 * theirs. Typical results:
 *   お願い / おねがい -> prefix お, base 願 (ねが), suffix い
 *   食べる / たべる   -> base 食 (た), suffix べる
 *
 * prefix.base + base + suffix.base always reproduces the surface. The match is
 * purely textual, so kana that coincide with the kanji's own reading can be
 * claimed by an affix; that approximation is accepted.
 *
 * @param surface      Token surface form (UTF-8)
 * @param reading_hira Reading already normalized to hiragana
 */
[[nodiscard]] OkuriganaSplit splitOkurigana(std::string_view surface, std::string_view reading_hira);

} // namespace furigana
