#include <catch2/catch_test_macros.hpp>

#include "furigana/Diagnostics.hpp"
#include "furigana/StageRunner.hpp"
#include "utils/ErrorReporter.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace furigana;

TEST_CASE("Diagnostics - preview escapes line breaks", "[diagnostics]")
{
    REQUIRE(Diagnostics::Preview("a\nb\tc") == "a\\nb\\tc");
    REQUIRE(Diagnostics::Preview(std::string("x\x01y")) == "x?y");
}

TEST_CASE("Diagnostics - preview never cuts a character in half", "[diagnostics]")
{
    const std::size_t saved = Diagnostics::MaxPreview();
    Diagnostics::SetMaxPreview(4);

    REQUIRE(Diagnostics::Preview("漢字") == "漢... (6 bytes)");
    REQUIRE(Diagnostics::Preview("abc") == "abc");

    Diagnostics::SetMaxPreview(saved);
}

TEST_CASE("ErrorReporter - queue, last error and drain", "[diagnostics]")
{
    utils::ErrorReporter::ClearErrors();
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "first");
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Tokenizer, "second", "details");

    auto last = utils::ErrorReporter::GetLastError();
    REQUIRE(last.user_message == "second");
    REQUIRE(last.technical_details == "details");
    REQUIRE(last.severity == utils::ErrorSeverity::Error);
    REQUIRE(utils::ErrorReporter::Format(last) == "[Error] second: details");

    auto pending = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == 2);
    REQUIRE(pending[0].severity == utils::ErrorSeverity::Warning);
    REQUIRE(utils::ErrorReporter::Format(pending[0]) == "[Warning] first");
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - queue is bounded", "[diagnostics]")
{
    utils::ErrorReporter::ClearErrors();
    for (int i = 0; i < 150; ++i)
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Annotation, "warning " + std::to_string(i));

    auto pending = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(pending.size() == utils::ErrorReporter::kMaxPending);
    REQUIRE(pending.front().user_message == "warning 50");
    REQUIRE(pending.back().user_message == "warning 149");
    REQUIRE(std::string(utils::ErrorReporter::CategoryToString(utils::ErrorCategory::Annotation)) == "Annotation");
}

TEST_CASE("StageRunner - a throwing stage degrades to an empty payload", "[diagnostics]")
{
    utils::ErrorReporter::ClearErrors();

    auto ok = runStage("count", [] { return std::vector<int>{ 1, 2, 3 }; });
    REQUIRE(ok.succeeded);
    REQUIRE(ok.stage_name == "count");
    REQUIRE(takeOrEmpty(std::move(ok)).size() == 3);
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());

    auto failed = runStage("broken", []() -> std::vector<int> { throw std::runtime_error("boom"); });
    REQUIRE_FALSE(failed.succeeded);
    REQUIRE(failed.error == "boom");
    REQUIRE(takeOrEmpty(std::move(failed)).empty());

    auto report = utils::ErrorReporter::GetLastError();
    REQUIRE(report.category == utils::ErrorCategory::Annotation);
    REQUIRE(report.severity == utils::ErrorSeverity::Warning);
    REQUIRE(report.technical_details == "boom");
    utils::ErrorReporter::ClearErrors();
}
