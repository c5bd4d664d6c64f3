#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace
{

long long fileMtimeMs(const std::string& path)
{
    std::error_code ec;
    auto tp = fs::last_write_time(path, ec);
    if (ec)
        return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::vector<std::string> splitPath(std::string_view path)
{
    std::vector<std::string> parts;
    while (!path.empty())
    {
        auto dot = path.find('.');
        parts.emplace_back(path.substr(0, dot));
        if (dot == std::string_view::npos)
            break;
        path.remove_prefix(dot + 1);
    }
    return parts;
}

const toml::table* findSection(const toml::table& root, const std::string& path)
{
    const toml::table* current = &root;
    for (const auto& part : splitPath(path))
    {
        current = current->get_as<toml::table>(part);
        if (!current)
            return nullptr;
    }
    return current;
}

// Walks the path, creating missing tables. A non-table node on the way is an error.
toml::table* ensureSection(toml::table& root, const std::string& path)
{
    toml::table* current = &root;
    for (const auto& part : splitPath(path))
    {
        auto [it, inserted] = current->emplace<toml::table>(part);
        current = it->second.as_table();
        if (!current)
        {
            PLOG_WARNING << "Config key '" << part << "' in '" << path << "' is not a table";
            return nullptr;
        }
    }
    return current;
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

void ConfigManager::addSection(std::string path, SectionCallbacks callbacks)
{
    sections_.push_back({ std::move(path), std::move(callbacks) });
}

bool ConfigManager::load()
{
    last_error_.clear();
    last_mtime_ = fileMtimeMs(config_path_);

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        root_ = toml::table{};
        return true;
    }

    try
    {
        root_ = toml::parse(ifs, config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error at line " + std::to_string(pe.source().begin.line) + ": " +
                      std::string(pe.description());
        PLOG_WARNING << last_error_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors, using defaults", last_error_ + " (" +
                                                                                                  config_path_ + ")");
        return false;
    }

    static const toml::table empty;
    for (const auto& section : sections_)
    {
        const toml::table* table = findSection(root_, section.path);
        section.callbacks.load(table ? *table : empty);
    }
    return true;
}

bool ConfigManager::reloadIfChanged()
{
    auto mtime = fileMtimeMs(config_path_);
    if (mtime == 0 || mtime == last_mtime_)
        return false;

    if (!load())
        return false;

    PLOG_INFO << "Config reloaded from " << config_path_;
    return true;
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table document = root_;
    for (const auto& section : sections_)
    {
        toml::table* target = ensureSection(document, section.path);
        if (!target)
        {
            last_error_ = "cannot store section '" + section.path + "'";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
        const toml::table saved = section.callbacks.save();
        for (auto&& [key, value] : saved)
            target->insert_or_assign(key.str(), saved[key.str()]);
    }

    if (!writeFile(document))
        return false;

    root_ = std::move(document);
    last_mtime_ = fileMtimeMs(config_path_);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

// Writes next to the target and renames over it so a failed write leaves the old file
bool ConfigManager::writeFile(const toml::table& document)
{
    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        ofs << document;
        if (!ofs.flush())
        {
            last_error_ = "cannot write " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "cannot replace " + config_path_ + ": " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}
