#pragma once

#include "../furigana/FuriganaTypes.hpp"
#include "../furigana/ManualOverrideParser.hpp"

#include <optional>
#include <string>
#include <vector>

enum class OutputFormat
{
    Html,    // Converted fragment, or the input untouched when nothing changed
    Json,    // Resolved spans with their aligned chunks
    Widgets  // Viewport decorations (from, to, widget html)
};

struct CommandLineOptions
{
    std::string config_path = "config.toml";
    std::optional<std::string> input_path;                // Absent: read stdin
    std::optional<furigana::NotationStyle> notation;      // Overrides [furigana].notation_style
    std::optional<std::string> dictionary_dir;            // Overrides [tokenizer].dictionary_dir
    OutputFormat format = OutputFormat::Html;
    std::vector<furigana::ExclusionZone> selections;
    std::vector<furigana::Interval> visible;              // Non-empty: viewport mode
    bool verbose = false;
    bool show_help = false;
};

/// Parses argv[1..]. On failure returns false and fills `error`.
bool parseCommandLine(const std::vector<std::string>& args, CommandLineOptions& options, std::string& error);

/// "FROM:TO" with FROM <= TO, both decimal byte offsets
std::optional<furigana::Interval> parseRange(const std::string& text);

const char* outputFormatToString(OutputFormat format) noexcept;

std::string usageText();
