#include <catch2/catch_test_macros.hpp>

#include "furigana/MeCabTokenizer.hpp"
#include "furigana/TokenizerProvider.hpp"
#include "utils/ErrorReporter.hpp"

#include <chrono>

using namespace furigana;

TEST_CASE("MeCabTokenizer - missing dictionary reports and returns null", "[mecab]")
{
    utils::ErrorReporter::ClearErrors();

    MeCabTokenizer::Options options;
    options.dictionary_dir = "/nonexistent/furigana-test-dictionary";
    auto tokenizer = MeCabTokenizer::create(options);

    REQUIRE(tokenizer == nullptr);
    REQUIRE(utils::ErrorReporter::HasPendingErrors());

    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(errors.back().category == utils::ErrorCategory::Tokenizer);
    REQUIRE(errors.back().severity == utils::ErrorSeverity::Error);
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("MeCabTokenizer - provider falls back to no tokenizer on a bad dictionary", "[mecab]")
{
    MeCabTokenizer::Options options;
    options.dictionary_dir = "/nonexistent/furigana-test-dictionary";
    TokenizerProvider provider([options]() -> TokenizerHandle { return MeCabTokenizer::create(options); });

    REQUIRE_FALSE(provider.waitUntilReady(std::chrono::milliseconds(5000)));
    REQUIRE(provider.tokenizer() == nullptr);
    utils::ErrorReporter::ClearErrors();
}
