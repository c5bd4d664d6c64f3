#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

// Load/save pair for one settings section
struct SectionCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

/**
 * @brief Owner of the TOML configuration file.
 *
 * Sections are addressed by dotted table path ("furigana", "app.debug").
 * load() hands each section its table, or an empty one when the file has none.
 * save() merges each section's keys into the parsed document key by key, so
 * tables and keys that no section writes are kept as they were.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");

    void addSection(std::string path, SectionCallbacks callbacks);

    bool load();
    bool reloadIfChanged();
    bool save();

    const toml::table& root() const { return root_; }
    const char* lastError() const { return last_error_.c_str(); }
    const std::string& configPath() const { return config_path_; }

private:
    struct Section
    {
        std::string path;
        SectionCallbacks callbacks;
    };

    bool writeFile(const toml::table& document);

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;
    std::vector<Section> sections_;
    toml::table root_;
};
