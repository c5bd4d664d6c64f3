#include "StateSerializer.hpp"
#include "FuriganaSettings.hpp"

#include <plog/Log.h>

toml::table StateSerializer::serializeFurigana(const FuriganaSettings& settings)
{
    return toml::table{
        { "reading_mode", settings.readingMode() },
        { "editing_mode", settings.editingMode() },
        { "notation_style", std::string(furigana::notationStyleToString(settings.notationStyle())) },
    };
}

void StateSerializer::deserializeFurigana(const toml::table& section, FuriganaSettings& settings)
{
    if (auto v = section["reading_mode"].value<bool>())
        settings.setReadingMode(*v);
    if (auto v = section["editing_mode"].value<bool>())
        settings.setEditingMode(*v);
    if (auto v = section["notation_style"].value<std::string>())
    {
        if (!furigana::isKnownNotationStyle(*v))
            PLOG_WARNING << "Unknown notation_style '" << *v << "', manual overrides disabled";
        settings.setNotationStyle(furigana::notationStyleFromString(*v));
    }
}

toml::table StateSerializer::serializeTokenizer(const FuriganaSettings& settings)
{
    return toml::table{
        { "dictionary_dir", settings.dictionaryDir() },
        { "reading_field", settings.readingField() },
        { "init_timeout_ms", settings.initTimeoutMs() },
    };
}

void StateSerializer::deserializeTokenizer(const toml::table& section, FuriganaSettings& settings)
{
    if (auto v = section["dictionary_dir"].value<std::string>())
        settings.setDictionaryDir(*v);
    if (auto v = section["reading_field"].value<int>())
        settings.setReadingField(*v);
    if (auto v = section["init_timeout_ms"].value<int>())
        settings.setInitTimeoutMs(*v);
}

toml::table StateSerializer::serializeGlobal(const FuriganaSettings& settings)
{
    return toml::table{ { "append_logs", settings.appendLogs() } };
}

void StateSerializer::deserializeGlobal(const toml::table& section, FuriganaSettings& settings)
{
    if (auto v = section["append_logs"].value<bool>())
        settings.setAppendLogs(*v);
}

toml::table StateSerializer::serializeDebug(const FuriganaSettings& settings)
{
    return toml::table{
        { "logging_level", settings.loggingLevel() },
        { "verbose", settings.verbose() },
    };
}

void StateSerializer::deserializeDebug(const toml::table& section, FuriganaSettings& settings)
{
    if (auto v = section["logging_level"].value<int>())
        settings.setLoggingLevel(*v);
    if (auto v = section["verbose"].value<bool>())
        settings.setVerbose(*v);
}
