#include <catch2/catch_test_macros.hpp>

#include "furigana/ManualOverrideParser.hpp"

#include <string>

using namespace furigana;

TEST_CASE("ManualOverrideParser - notation names", "[manual]")
{
    REQUIRE(notationStyleFromString("curly") == NotationStyle::Curly);
    REQUIRE(notationStyleFromString("square") == NotationStyle::Square);
    REQUIRE(notationStyleFromString("none") == NotationStyle::None);
    REQUIRE(notationStyleFromString("angle") == NotationStyle::None);
    REQUIRE(isKnownNotationStyle("square"));
    REQUIRE_FALSE(isKnownNotationStyle("Curly"));
    REQUIRE(std::string(notationStyleToString(NotationStyle::Square)) == "square");
}

TEST_CASE("ManualOverrideParser - curly match reports groups and byte interval", "[manual]")
{
    const std::string text = "これは{漢字|かん|じ}です";
    auto matches = findManualOverrides(text, NotationStyle::Curly);

    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0].base == "漢字");
    REQUIRE(matches[0].reading_tail == "|かん|じ");
    REQUIRE(matches[0].interval.from == text.find('{'));
    REQUIRE(matches[0].interval.to == text.find('}') + 1);
}

TEST_CASE("ManualOverrideParser - square notation ignores curly markup", "[manual]")
{
    const std::string text = "{今日|きょう} [明日|あした]";
    auto square = findManualOverrides(text, NotationStyle::Square);
    REQUIRE(square.size() == 1);
    REQUIRE(square[0].base == "明日");

    auto curly = findManualOverrides(text, NotationStyle::Curly);
    REQUIRE(curly.size() == 1);
    REQUIRE(curly[0].base == "今日");
}

TEST_CASE("ManualOverrideParser - none never matches", "[manual]")
{
    REQUIRE(findManualOverrides("{漢字|かんじ}", NotationStyle::None).empty());
    REQUIRE(parseManualOverrides("[漢字|かんじ]", NotationStyle::None).empty());
}

TEST_CASE("ManualOverrideParser - malformed markup is not an override", "[manual]")
{
    REQUIRE(findManualOverrides("{漢字}", NotationStyle::Curly).empty());
    REQUIRE(findManualOverrides("{|かんじ}", NotationStyle::Curly).empty());
    REQUIRE(findManualOverrides("{漢字|}", NotationStyle::Curly).empty());
    REQUIRE(findManualOverrides("{漢字||じ}", NotationStyle::Curly).empty());
    REQUIRE(findManualOverrides("{漢\n字|かんじ}", NotationStyle::Curly).empty());
}

TEST_CASE("ManualOverrideParser - several overrides, base offset applied", "[manual]")
{
    const std::string text = "{今日|きょう}と{明日|あした}";
    auto matches = findManualOverrides(text, NotationStyle::Curly, 100);

    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0].interval.from == 100);
    REQUIRE(matches[1].interval.from == 100 + text.find("{明日"));
    REQUIRE(matches[0].interval.to <= matches[1].interval.from);
}

TEST_CASE("ManualOverrideParser - single reading covers the whole base", "[manual]")
{
    auto segment = alignManualReadings("今日", "|きょう");
    REQUIRE(segment.base_chunks == std::vector<std::string>{ "今日" });
    REQUIRE(segment.reading_chunks == std::vector<std::string>{ "きょう" });
}

TEST_CASE("ManualOverrideParser - readings distributed per character", "[manual]")
{
    auto segment = alignManualReadings("漢字", "|かん|じ");
    REQUIRE(segment.base_chunks == std::vector<std::string>{ "漢", "字" });
    REQUIRE(segment.reading_chunks == std::vector<std::string>{ "かん", "じ" });
}

TEST_CASE("ManualOverrideParser - short reading lists repeat the last reading", "[manual]")
{
    auto segment = alignManualReadings("一二三", "|いち|に");
    REQUIRE(segment.base_chunks == std::vector<std::string>{ "一", "二", "三" });
    REQUIRE(segment.reading_chunks == std::vector<std::string>{ "いち", "に", "に" });
}

TEST_CASE("ManualOverrideParser - excess readings are ignored", "[manual]")
{
    auto segment = alignManualReadings("字", "|じ|あざ|な");
    REQUIRE(segment.base_chunks == std::vector<std::string>{ "字" });
    REQUIRE(segment.reading_chunks == std::vector<std::string>{ "じ" });
}

TEST_CASE("ManualOverrideParser - candidates carry Manual origin", "[manual]")
{
    auto candidates = parseManualOverrides("{東京|とうきょう}", NotationStyle::Curly);
    REQUIRE(candidates.size() == 1);
    REQUIRE(candidates[0].origin == Origin::Manual);
    REQUIRE(candidates[0].interval.from == 0);
    REQUIRE(candidates[0].segment.reading_chunks.front() == "とうきょう");
}
