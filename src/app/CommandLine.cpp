#include "CommandLine.hpp"

#include <charconv>
#include <string_view>

namespace
{

bool parseOffset(std::string_view text, std::size_t& value)
{
    if (text.empty())
        return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && ptr == text.data() + text.size();
}

std::optional<OutputFormat> outputFormatFromString(std::string_view name)
{
    if (name == "html")
        return OutputFormat::Html;
    if (name == "json")
        return OutputFormat::Json;
    if (name == "widgets")
        return OutputFormat::Widgets;
    return std::nullopt;
}

} // namespace

std::optional<furigana::Interval> parseRange(const std::string& text)
{
    const auto colon = text.find(':');
    if (colon == std::string::npos)
        return std::nullopt;

    furigana::Interval range;
    std::string_view view(text);
    if (!parseOffset(view.substr(0, colon), range.from) || !parseOffset(view.substr(colon + 1), range.to))
        return std::nullopt;
    if (range.from > range.to)
        return std::nullopt;
    return range;
}

bool parseCommandLine(const std::vector<std::string>& args, CommandLineOptions& options, std::string& error)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        auto nextValue = [&](std::string& value) {
            if (i + 1 >= args.size())
            {
                error = "missing value for " + arg;
                return false;
            }
            value = args[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--config")
        {
            if (!nextValue(value))
                return false;
            options.config_path = value;
        }
        else if (arg == "--dict")
        {
            if (!nextValue(value))
                return false;
            options.dictionary_dir = value;
        }
        else if (arg == "--notation")
        {
            if (!nextValue(value))
                return false;
            if (!furigana::isKnownNotationStyle(value))
            {
                error = "unknown notation style '" + value + "' (expected curly, square or none)";
                return false;
            }
            options.notation = furigana::notationStyleFromString(value);
        }
        else if (arg == "--format")
        {
            if (!nextValue(value))
                return false;
            auto format = outputFormatFromString(value);
            if (!format)
            {
                error = "unknown output format '" + value + "' (expected html, json or widgets)";
                return false;
            }
            options.format = *format;
        }
        else if (arg == "--select" || arg == "--visible")
        {
            if (!nextValue(value))
                return false;
            auto range = parseRange(value);
            if (!range)
            {
                error = "invalid range '" + value + "' for " + arg + " (expected FROM:TO)";
                return false;
            }
            if (arg == "--select")
                options.selections.push_back(furigana::ExclusionZone{ range->from, range->to });
            else
                options.visible.push_back(*range);
        }
        else if (!arg.empty() && arg[0] == '-' && arg != "-")
        {
            error = "unknown option " + arg;
            return false;
        }
        else
        {
            if (options.input_path)
            {
                error = "more than one input file given";
                return false;
            }
            // "-" keeps stdin
            if (arg != "-")
                options.input_path = arg;
        }
    }
    return true;
}

const char* outputFormatToString(OutputFormat format) noexcept
{
    switch (format)
    {
    case OutputFormat::Html:
        return "html";
    case OutputFormat::Json:
        return "json";
    case OutputFormat::Widgets:
        return "widgets";
    }
    return "html";
}

std::string usageText()
{
    return "Usage: furigana [options] [FILE]\n"
           "\n"
           "Annotates Japanese text with furigana. Reads FILE, or stdin when FILE is absent or '-'.\n"
           "\n"
           "Options:\n"
           "  --config PATH        TOML settings file (default: config.toml)\n"
           "  --notation STYLE     Manual override brackets: curly, square or none\n"
           "  --dict DIR           MeCab dictionary directory\n"
           "  --format FORMAT      html (default), json or widgets\n"
           "  --select FROM:TO     Byte range left untouched (repeatable; FROM == TO is a caret)\n"
           "  --visible FROM:TO    Visible byte range; switches to viewport mode (repeatable)\n"
           "  -v, --verbose        Log every pipeline stage to logs/diagnostics.log\n"
           "  -h, --help           Show this help\n";
}
