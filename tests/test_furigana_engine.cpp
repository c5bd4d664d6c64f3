#include <catch2/catch_test_macros.hpp>

#include "furigana/FuriganaEngine.hpp"
#include "furigana/TokenizerProvider.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/fake_tokenizer.hpp"

#include <string>

using namespace furigana;

namespace
{
std::string slice(const std::string& text, const ResolvedSpan& span)
{
    return text.substr(span.interval.from, span.interval.length());
}

bool sortedAndDisjoint(const std::vector<ResolvedSpan>& spans)
{
    for (std::size_t i = 1; i < spans.size(); ++i)
    {
        if (spans[i].interval.from < spans[i - 1].interval.to)
            return false;
    }
    return true;
}
} // namespace

TEST_CASE("FuriganaEngine - お願いします becomes one automatic span", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    const std::string text = "お願いします";
    auto spans = engine.annotate(text);

    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].origin == Origin::Automatic);
    REQUIRE(slice(text, spans[0]) == text);

    const auto& seg = spans[0].segment;
    REQUIRE(seg.base_chunks.size() == seg.reading_chunks.size());
    REQUIRE(seg.base_chunks[0] == "お");
    REQUIRE(seg.base_chunks[1] == "願");
    REQUIRE_FALSE(seg.reading_chunks[1].empty());

    std::string tail;
    for (std::size_t i = 2; i < seg.size(); ++i)
        tail += seg.base_chunks[i];
    REQUIRE(tail == "いします");
}

TEST_CASE("FuriganaEngine - manual override beside automatic runs", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    const std::string text = "これは{漢字|かん|じ}です";
    auto spans = engine.annotate(text);

    REQUIRE(spans.size() == 3);
    REQUIRE(sortedAndDisjoint(spans));

    REQUIRE(spans[0].origin == Origin::Automatic);
    REQUIRE(slice(text, spans[0]) == "これは");

    REQUIRE(spans[1].origin == Origin::Manual);
    REQUIRE(slice(text, spans[1]) == "{漢字|かん|じ}");
    REQUIRE(spans[1].segment.base_chunks == std::vector<std::string>{ "漢", "字" });
    REQUIRE(spans[1].segment.reading_chunks == std::vector<std::string>{ "かん", "じ" });

    REQUIRE(spans[2].origin == Origin::Automatic);
    REQUIRE(slice(text, spans[2]) == "です");
}

TEST_CASE("FuriganaEngine - notation none leaves markup to the automatic pass", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    AnnotationOptions options;
    options.notation = NotationStyle::None;

    auto spans = engine.annotate("{今日|きょう}", options);
    for (const auto& span : spans)
        REQUIRE(span.origin == Origin::Automatic);
    REQUIRE(spans.size() == 2);
}

TEST_CASE("FuriganaEngine - identical input gives identical output", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    const std::string text = "今日は{東京|とうきょう}で `漢字` ラーメンを食べる";

    auto first = engine.annotate(text);
    auto second = engine.annotate(text);
    REQUIRE(first == second);

    std::vector<Interval> visible{ Interval{ 0, text.size() } };
    REQUIRE(engine.annotateVisible(text, visible) == engine.annotateVisible(text, visible));
}

TEST_CASE("FuriganaEngine - selections and carets block replacement", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    const std::string text = "今日は{漢字|かんじ}";

    AnnotationOptions options;
    options.selections.push_back(ExclusionZone{ text.find('{') + 1, text.find('{') + 1 });
    auto spans = engine.annotate(text, options);

    // Caret inside the markup: the markup stays raw and so does its inner text
    REQUIRE(spans.size() == 1);
    REQUIRE(slice(text, spans[0]) == "今日は");
}

TEST_CASE("FuriganaEngine - code is never annotated", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    const std::string text = "今日 `東京` です\n```\n{漢字|かんじ}\n```\n天気";
    auto spans = engine.annotate(text);

    std::vector<std::string> covered;
    for (const auto& span : spans)
        covered.push_back(slice(text, span));
    REQUIRE(covered == std::vector<std::string>{ "今日", "です", "天気" });

    AnnotationOptions keep_code;
    keep_code.skip_code = false;
    REQUIRE(engine.annotate(text, keep_code).size() > spans.size());
}

TEST_CASE("FuriganaEngine - no tokenizer still produces aligned spans", "[engine]")
{
    FuriganaEngine engine;
    auto spans = engine.annotate("漢字とかな");

    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].segment.base_chunks == std::vector<std::string>{ "漢字", "とかな" });
    REQUIRE(spans[0].segment.reading_chunks == std::vector<std::string>{ "漢字", "とかな" });
}

TEST_CASE("FuriganaEngine - a throwing tokenizer degrades to manual spans", "[engine]")
{
    utils::ErrorReporter::ClearErrors();
    FuriganaEngine engine(std::make_shared<test_utils::ThrowingTokenizer>());
    const std::string text = "今日は{漢字|かんじ}";

    auto spans = engine.annotate(text);
    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].origin == Origin::Manual);

    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Annotation);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("FuriganaEngine - empty input", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    REQUIRE(engine.annotate("").empty());
    REQUIRE(engine.annotateVisible("", { Interval{ 0, 0 } }).empty());
    REQUIRE(engine.annotateVisible("今日", {}).empty());
}

TEST_CASE("FuriganaEngine - viewport mode only touches visible lines", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    const std::string text = "今日\n天気\n東京\n漢字";
    const std::size_t line2 = text.find("東京");

    auto spans = engine.annotateVisible(text, { Interval{ line2, line2 + 2 } });
    REQUIRE(spans.size() == 1);
    REQUIRE(slice(text, spans[0]) == "東京");
    REQUIRE(spans[0].interval.from == line2);
}

TEST_CASE("FuriganaEngine - viewport and static agree on a fully visible document", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    const std::string text = "これは{漢字|かん|じ}です\n`東京` 今日は\n```\n天気\n```\n終わり";

    auto whole = engine.annotate(text);
    auto visible = engine.annotateVisible(text, { Interval{ 0, text.size() } });
    REQUIRE(whole == visible);
}

TEST_CASE("FuriganaEngine - overlapping visible ranges do not duplicate spans", "[engine]")
{
    FuriganaEngine engine(test_utils::makeSampleTokenizer());
    const std::string text = "今日\n天気\n東京";

    auto spans = engine.annotateVisible(text, { Interval{ 0, 8 }, Interval{ 3, text.size() } });
    REQUIRE(spans.size() == 3);
    REQUIRE(sortedAndDisjoint(spans));
}

TEST_CASE("FuriganaEngine - picks up a tokenizer once the provider has built it", "[engine]")
{
    TokenizerProvider provider([] { return test_utils::makeSampleTokenizer(); });
    FuriganaEngine engine(&provider);

    auto before = engine.annotate("お願い");
    REQUIRE(before.size() == 1);
    REQUIRE(before[0].segment.base_chunks == std::vector<std::string>{ "お", "願", "い" });
    REQUIRE(before[0].segment.reading_chunks == std::vector<std::string>{ "お", "願", "い" });

    REQUIRE(provider.waitUntilReady());
    auto after = engine.annotate("お願い");
    REQUIRE(after.size() == 1);
    REQUIRE(after[0].segment.base_chunks == std::vector<std::string>{ "お", "願", "い" });
    REQUIRE(after[0].segment.reading_chunks == std::vector<std::string>{ "お", "ねが", "い" });
}
