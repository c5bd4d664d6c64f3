#pragma once

#include "furigana/ITokenizer.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace test_utils {

// Dictionary-driven tokenizer: at every position the longest known surface
// wins; anything unknown becomes a one-character token without a reading.
class FakeTokenizer : public furigana::ITokenizer {
public:
    FakeTokenizer() = default;
    explicit FakeTokenizer(std::map<std::string, std::string> dictionary);

    // Register a surface with its katakana reading
    void addWord(const std::string& surface, const std::string& reading);

    std::vector<furigana::Token> tokenize(const std::string& text) const override;

    // Number of tokenize() calls so far
    std::size_t calls() const { return calls_.load(); }

private:
    std::map<std::string, std::string> dictionary_;
    std::size_t longest_ = 0;
    mutable std::atomic<std::size_t> calls_{0};
};

// Tokenizer that always throws, for stage failure paths
class ThrowingTokenizer : public furigana::ITokenizer {
public:
    std::vector<furigana::Token> tokenize(const std::string& text) const override;
};

// The handful of words the engine tests use
std::shared_ptr<FakeTokenizer> makeSampleTokenizer();

} // namespace test_utils
