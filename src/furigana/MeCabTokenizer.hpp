#pragma once

#include "ITokenizer.hpp"

#include <memory>
#include <string>

// Forward declarations
namespace MeCab {
class Model;
class Tagger;
}

namespace furigana
{

/**
 * @brief ITokenizer backed by MeCab.
 *
 * One MeCab::Model/Tagger pair is shared; every tokenize() call parses into its
 * own lattice, which MeCab documents as safe for concurrent use.
 *
 * The reading is taken from a fixed CSV field of the node feature string
 * (IPADIC: 品詞,細分類1,細分類2,細分類3,活用型,活用形,原形,読み,発音 -> index 7).
 * Nodes without that field (unknown words) carry no reading.
 */
class MeCabTokenizer : public ITokenizer
{
public:
    struct Options
    {
        std::string dictionary_dir;   // Empty: MeCab's configured default dictionary
        int reading_field = 7;
    };

    /// Returns null (and reports the MeCab error) when the dictionary cannot be loaded
    static std::shared_ptr<MeCabTokenizer> create(const Options& options);

    ~MeCabTokenizer() override;

    MeCabTokenizer(const MeCabTokenizer&) = delete;
    MeCabTokenizer& operator=(const MeCabTokenizer&) = delete;

    [[nodiscard]] std::vector<Token> tokenize(const std::string& text) const override;

private:
    MeCabTokenizer(MeCab::Model* model, MeCab::Tagger* tagger, int reading_field);

    MeCab::Model* model_;
    MeCab::Tagger* tagger_;
    int reading_field_;
};

} // namespace furigana
