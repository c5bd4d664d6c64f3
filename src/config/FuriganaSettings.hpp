#pragma once

#include "../furigana/ManualOverrideParser.hpp"

#include <optional>
#include <string>

class ConfigManager;

// Partial update, e.g. from command-line overrides. Unset fields stay as they are.
struct SettingsPatch
{
    std::optional<bool> reading_mode;
    std::optional<bool> editing_mode;
    std::optional<furigana::NotationStyle> notation;
    std::optional<std::string> dictionary_dir;
    std::optional<bool> verbose;
};

/**
 * @brief Persisted furigana settings.
 *
 * [furigana]   reading_mode, editing_mode, notation_style
 * [tokenizer]  dictionary_dir, reading_field, init_timeout_ms
 * [global]     append_logs
 * [app.debug]  logging_level, verbose
 *
 * Setters clamp out-of-range values. The ones that affect annotation output
 * return true when the value actually changed, meaning spans computed with the
 * old value are stale.
 */
class FuriganaSettings
{
public:
    static constexpr int kMinReadingField = 0;
    static constexpr int kMaxReadingField = 32;
    static constexpr int kMinInitTimeoutMs = 100;
    static constexpr int kMaxInitTimeoutMs = 600000;

    FuriganaSettings();

    void applyDefaults();
    void registerConfigHandler(ConfigManager& config);

    bool readingMode() const { return reading_mode_; }
    bool setReadingMode(bool enabled);

    bool editingMode() const { return editing_mode_; }
    bool setEditingMode(bool enabled);

    furigana::NotationStyle notationStyle() const { return notation_style_; }
    bool setNotationStyle(furigana::NotationStyle style);

    const std::string& dictionaryDir() const { return dictionary_dir_; }
    void setDictionaryDir(const std::string& dir) { dictionary_dir_ = dir; }

    int readingField() const { return reading_field_; }
    void setReadingField(int field);

    int initTimeoutMs() const { return init_timeout_ms_; }
    void setInitTimeoutMs(int timeout_ms);

    bool appendLogs() const { return append_logs_; }
    void setAppendLogs(bool enabled) { append_logs_ = enabled; }

    int loggingLevel() const { return logging_level_; }
    void setLoggingLevel(int level);

    bool verbose() const { return verbose_; }
    void setVerbose(bool enabled) { verbose_ = enabled; }

    /// Returns true when any annotation-affecting field changed
    bool applyPatch(const SettingsPatch& patch);

private:
    bool reading_mode_ = true;
    bool editing_mode_ = true;
    furigana::NotationStyle notation_style_ = furigana::NotationStyle::Curly;

    std::string dictionary_dir_;
    int reading_field_ = 7;
    int init_timeout_ms_ = 10000;

    bool append_logs_ = true;
    int logging_level_ = 4;
    bool verbose_ = false;
};
