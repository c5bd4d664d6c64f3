#include "OutputFormatter.hpp"
#include "../furigana/RubyRenderer.hpp"

nlohmann::json spansToJson(const std::vector<furigana::ResolvedSpan>& spans)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto& span : spans)
    {
        out.push_back({ { "from", span.interval.from },
                        { "to", span.interval.to },
                        { "origin", furigana::originToString(span.origin) },
                        { "base", span.segment.base_chunks },
                        { "reading", span.segment.reading_chunks } });
    }
    return out;
}

nlohmann::json decorationsToJson(const std::vector<furigana::ResolvedSpan>& spans)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto& decoration : furigana::buildDecorations(spans))
    {
        out.push_back({ { "from", decoration.from }, { "to", decoration.to }, { "html", decoration.html } });
    }
    return out;
}

std::string formatOutput(OutputFormat format, std::string_view text, const std::vector<furigana::ResolvedSpan>& spans,
                         bool enabled)
{
    switch (format)
    {
    case OutputFormat::Html:
    {
        if (!enabled)
            return std::string(text);
        auto fragment = furigana::convertToHtml(text, spans);
        return fragment.changed ? fragment.html : std::string(text);
    }
    case OutputFormat::Json:
        return (enabled ? spansToJson(spans) : nlohmann::json::array()).dump(2) + "\n";
    case OutputFormat::Widgets:
        return (enabled ? decorationsToJson(spans) : nlohmann::json::array()).dump(2) + "\n";
    }
    return std::string(text);
}
