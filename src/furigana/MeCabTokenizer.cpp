#include "MeCabTokenizer.hpp"
#include "Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <mecab.h>
#include <optional>
#include <string_view>
#include <plog/Log.h>

namespace furigana
{

namespace
{

std::string lastMeCabError()
{
    const char* err = MeCab::getLastError();
    return err ? std::string(err) : std::string("unknown MeCab error");
}

std::optional<std::string> featureField(const char* feature, int index)
{
    if (!feature || index < 0)
        return std::nullopt;

    std::string_view csv(feature);
    int current = 0;
    std::size_t start = 0;
    while (current < index)
    {
        std::size_t comma = csv.find(',', start);
        if (comma == std::string_view::npos)
            return std::nullopt;
        start = comma + 1;
        ++current;
    }

    std::size_t end = csv.find(',', start);
    if (end == std::string_view::npos)
        end = csv.size();
    return std::string(csv.substr(start, end - start));
}

struct LatticeDeleter
{
    void operator()(MeCab::Lattice* lattice) const noexcept { delete lattice; }
};

} // namespace

std::shared_ptr<MeCabTokenizer> MeCabTokenizer::create(const Options& options)
{
    std::string args;
    if (!options.dictionary_dir.empty())
        args = "-d " + options.dictionary_dir;

    MeCab::Model* model = MeCab::createModel(args.c_str());
    if (!model)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Tokenizer, "Failed to load MeCab dictionary",
                                          lastMeCabError());
        return nullptr;
    }

    MeCab::Tagger* tagger = model->createTagger();
    if (!tagger)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Tokenizer, "Failed to create MeCab tagger",
                                          lastMeCabError());
        delete model;
        return nullptr;
    }

    const MeCab::DictionaryInfo* info = model->dictionary_info();
    PLOG_INFO << "MeCab " << MeCab::Model::version() << " loaded dictionary "
              << (info && info->filename ? info->filename : "(default)")
              << " charset=" << (info && info->charset ? info->charset : "?");

    return std::shared_ptr<MeCabTokenizer>(new MeCabTokenizer(model, tagger, options.reading_field));
}

MeCabTokenizer::MeCabTokenizer(MeCab::Model* model, MeCab::Tagger* tagger, int reading_field)
    : model_(model)
    , tagger_(tagger)
    , reading_field_(reading_field)
{
}

MeCabTokenizer::~MeCabTokenizer()
{
    delete tagger_;
    delete model_;
}

std::vector<Token> MeCabTokenizer::tokenize(const std::string& text) const
{
    PROFILE_SCOPE_FUNCTION();

    std::vector<Token> tokens;
    if (text.empty())
        return tokens;

    std::unique_ptr<MeCab::Lattice, LatticeDeleter> lattice(model_->createLattice());
    if (!lattice)
    {
        PLOG_WARNING << "MeCab could not allocate a lattice; returning input as one token";
        tokens.push_back(Token{text, std::nullopt});
        return tokens;
    }

    lattice->set_sentence(text.c_str());
    if (!tagger_->parse(lattice.get()))
    {
        PLOG_WARNING << "MeCab parse failed: " << (lattice->what() ? lattice->what() : "?");
        tokens.push_back(Token{text, std::nullopt});
        return tokens;
    }

    for (const MeCab::Node* node = lattice->bos_node(); node; node = node->next)
    {
        if (node->stat == MECAB_BOS_NODE || node->stat == MECAB_EOS_NODE)
            continue;

        // rlength counts the whitespace MeCab skipped in front of the surface
        if (node->rlength > node->length)
        {
            const std::size_t skipped = node->rlength - node->length;
            tokens.push_back(Token{std::string(node->surface - skipped, skipped), std::nullopt});
        }

        Token token;
        token.surface.assign(node->surface, node->length);
        token.reading = featureField(node->feature, reading_field_);
        tokens.push_back(std::move(token));
    }

    if (Diagnostics::IsVerbose())
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[MeCabTokenizer] " << tokens.size() << " tokens for "
                                               << Diagnostics::Preview(text);

    return tokens;
}

} // namespace furigana
