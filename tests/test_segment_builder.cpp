#include <catch2/catch_test_macros.hpp>

#include "furigana/SegmentBuilder.hpp"
#include "utils/fake_tokenizer.hpp"

#include <string>

using namespace furigana;

namespace
{
std::string joined(const std::vector<std::string>& parts)
{
    std::string out;
    for (const auto& p : parts)
        out += p;
    return out;
}
} // namespace

TEST_CASE("SegmentBuilder - empty input yields an empty segment", "[segment]")
{
    SegmentBuilder builder(test_utils::makeSampleTokenizer());
    REQUIRE(builder.build("").empty());
}

TEST_CASE("SegmentBuilder - okurigana split for お願いします", "[segment]")
{
    SegmentBuilder builder(test_utils::makeSampleTokenizer());
    auto segment = builder.build("お願いします");

    REQUIRE(segment.base_chunks == std::vector<std::string>{ "お", "願", "い", "します" });
    REQUIRE(segment.reading_chunks == std::vector<std::string>{ "お", "ねが", "い", "します" });
    REQUIRE(joined(segment.base_chunks) == "お願いします");
}

TEST_CASE("SegmentBuilder - kana-only tokens pass through unsplit", "[segment]")
{
    SegmentBuilder builder(test_utils::makeSampleTokenizer());
    auto segment = builder.build("ラーメン");

    REQUIRE(segment.size() == 1);
    REQUIRE(segment.base_chunks[0] == "ラーメン");
    REQUIRE(segment.reading_chunks[0] == "らーめん");
}

TEST_CASE("SegmentBuilder - arrays stay aligned and non-empty", "[segment]")
{
    SegmentBuilder builder(test_utils::makeSampleTokenizer());
    for (const std::string text : { "今日は天気です", "日本語", "東京ラーメン", "未知語" })
    {
        auto segment = builder.build(text);
        REQUIRE(segment.size() >= 1);
        REQUIRE(segment.base_chunks.size() == segment.reading_chunks.size());
        REQUIRE(joined(segment.base_chunks) == text);
    }
}

TEST_CASE("SegmentBuilder - unknown words read as written", "[segment]")
{
    SegmentBuilder builder(test_utils::makeSampleTokenizer());
    auto segment = builder.build("未知");

    REQUIRE(segment.base_chunks == std::vector<std::string>{ "未", "知" });
    REQUIRE(segment.reading_chunks == std::vector<std::string>{ "未", "知" });
}

TEST_CASE("SegmentBuilder - no tokenizer splits the whole input as one token", "[segment]")
{
    SegmentBuilder builder;
    REQUIRE_FALSE(builder.hasTokenizer());

    auto segment = builder.build("漢字カナ");
    REQUIRE(segment.base_chunks == std::vector<std::string>{ "漢字", "カナ" });
    REQUIRE(segment.reading_chunks == std::vector<std::string>{ "漢字", "かな" });

    segment = builder.build("お願い");
    REQUIRE(segment.base_chunks == std::vector<std::string>{ "お", "願", "い" });
    REQUIRE(segment.reading_chunks == std::vector<std::string>{ "お", "願", "い" });
}

TEST_CASE("SegmentBuilder - tokens without surfaces fall back to the input", "[segment]")
{
    class EmptyTokenizer : public ITokenizer
    {
    public:
        std::vector<Token> tokenize(const std::string&) const override { return { Token{ "", std::nullopt } }; }
    };

    SegmentBuilder builder(std::make_shared<EmptyTokenizer>());
    auto segment = builder.build("テスト");
    REQUIRE(segment.size() == 1);
    REQUIRE(segment.base_chunks[0] == "テスト");
    REQUIRE(segment.reading_chunks[0] == "てすと");
}
