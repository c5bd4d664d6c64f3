#pragma once

#include <toml++/toml.h>

class FuriganaSettings;

// TOML serialization for persisted settings, one pair per config section.
// Deserializers leave settings untouched for keys that are missing or mistyped.
class StateSerializer
{
public:
    // [furigana] reading_mode, editing_mode, notation_style
    static toml::table serializeFurigana(const FuriganaSettings& settings);
    static void deserializeFurigana(const toml::table& section, FuriganaSettings& settings);

    // [tokenizer] dictionary_dir, reading_field, init_timeout_ms
    static toml::table serializeTokenizer(const FuriganaSettings& settings);
    static void deserializeTokenizer(const toml::table& section, FuriganaSettings& settings);

    // [global] append_logs
    static toml::table serializeGlobal(const FuriganaSettings& settings);
    static void deserializeGlobal(const toml::table& section, FuriganaSettings& settings);

    // [app.debug] logging_level, verbose
    static toml::table serializeDebug(const FuriganaSettings& settings);
    static void deserializeDebug(const toml::table& section, FuriganaSettings& settings);
};
