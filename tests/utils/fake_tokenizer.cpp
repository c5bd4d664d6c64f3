#include "fake_tokenizer.hpp"

#include <algorithm>
#include <stdexcept>

namespace test_utils {

namespace {

std::size_t utf8Length(unsigned char lead)
{
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 1;
}

} // namespace

FakeTokenizer::FakeTokenizer(std::map<std::string, std::string> dictionary)
{
    for (auto& [surface, reading] : dictionary)
        addWord(surface, reading);
}

void FakeTokenizer::addWord(const std::string& surface, const std::string& reading)
{
    dictionary_[surface] = reading;
    longest_ = std::max(longest_, surface.size());
}

std::vector<furigana::Token> FakeTokenizer::tokenize(const std::string& text) const
{
    ++calls_;
    std::vector<furigana::Token> tokens;

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t best = 0;
        const std::size_t max_len = std::min(longest_, text.size() - pos);
        for (std::size_t len = max_len; len > 0; --len) {
            if (dictionary_.count(text.substr(pos, len))) {
                best = len;
                break;
            }
        }

        if (best > 0) {
            std::string surface = text.substr(pos, best);
            tokens.push_back(furigana::Token{surface, dictionary_.at(surface)});
            pos += best;
            continue;
        }

        const std::size_t len = std::min(utf8Length(static_cast<unsigned char>(text[pos])), text.size() - pos);
        tokens.push_back(furigana::Token{text.substr(pos, len), std::nullopt});
        pos += len;
    }
    return tokens;
}

std::vector<furigana::Token> ThrowingTokenizer::tokenize(const std::string&) const
{
    throw std::runtime_error("tokenizer exploded");
}

std::shared_ptr<FakeTokenizer> makeSampleTokenizer()
{
    return std::make_shared<FakeTokenizer>(std::map<std::string, std::string>{
        {"お願い", "オネガイ"},
        {"します", "シマス"},
        {"これ", "コレ"},
        {"は", "ハ"},
        {"です", "デス"},
        {"今日", "キョウ"},
        {"天気", "テンキ"},
        {"食べる", "タベル"},
        {"日本語", "ニホンゴ"},
        {"漢字", "カンジ"},
        {"東京", "トウキョウ"},
        {"ラーメン", "ラーメン"},
    });
}

} // namespace test_utils
