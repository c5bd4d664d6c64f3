#include "FuriganaSettings.hpp"
#include "ConfigManager.hpp"
#include "StateSerializer.hpp"

#include <algorithm>
#include <toml++/toml.h>

FuriganaSettings::FuriganaSettings()
{
    applyDefaults();
}

void FuriganaSettings::applyDefaults()
{
    reading_mode_ = true;
    editing_mode_ = true;
    notation_style_ = furigana::NotationStyle::Curly;

    dictionary_dir_.clear();
    reading_field_ = 7;
    init_timeout_ms_ = 10000;

    append_logs_ = true;
    logging_level_ = 4;
    verbose_ = false;
}

void FuriganaSettings::registerConfigHandler(ConfigManager& config)
{
    config.addSection("furigana", { [this](const toml::table& t) { StateSerializer::deserializeFurigana(t, *this); },
                                    [this] { return StateSerializer::serializeFurigana(*this); } });
    config.addSection("tokenizer", { [this](const toml::table& t) { StateSerializer::deserializeTokenizer(t, *this); },
                                     [this] { return StateSerializer::serializeTokenizer(*this); } });
    config.addSection("global", { [this](const toml::table& t) { StateSerializer::deserializeGlobal(t, *this); },
                                  [this] { return StateSerializer::serializeGlobal(*this); } });
    config.addSection("app.debug", { [this](const toml::table& t) { StateSerializer::deserializeDebug(t, *this); },
                                     [this] { return StateSerializer::serializeDebug(*this); } });
}

bool FuriganaSettings::setReadingMode(bool enabled)
{
    const bool changed = reading_mode_ != enabled;
    reading_mode_ = enabled;
    return changed;
}

bool FuriganaSettings::setEditingMode(bool enabled)
{
    const bool changed = editing_mode_ != enabled;
    editing_mode_ = enabled;
    return changed;
}

bool FuriganaSettings::setNotationStyle(furigana::NotationStyle style)
{
    const bool changed = notation_style_ != style;
    notation_style_ = style;
    return changed;
}

void FuriganaSettings::setReadingField(int field)
{
    reading_field_ = std::clamp(field, kMinReadingField, kMaxReadingField);
}

void FuriganaSettings::setInitTimeoutMs(int timeout_ms)
{
    init_timeout_ms_ = std::clamp(timeout_ms, kMinInitTimeoutMs, kMaxInitTimeoutMs);
}

void FuriganaSettings::setLoggingLevel(int level)
{
    logging_level_ = std::clamp(level, 0, 6);
}

bool FuriganaSettings::applyPatch(const SettingsPatch& patch)
{
    bool changed = false;
    if (patch.reading_mode)
        changed |= setReadingMode(*patch.reading_mode);
    if (patch.editing_mode)
        changed |= setEditingMode(*patch.editing_mode);
    if (patch.notation)
        changed |= setNotationStyle(*patch.notation);
    if (patch.dictionary_dir)
        setDictionaryDir(*patch.dictionary_dir);
    if (patch.verbose)
        setVerbose(*patch.verbose);
    return changed;
}
