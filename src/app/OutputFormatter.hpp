#pragma once

#include "CommandLine.hpp"
#include "../furigana/FuriganaTypes.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// Span dump: [{from, to, origin, base: [...], reading: [...]}, ...]
nlohmann::json spansToJson(const std::vector<furigana::ResolvedSpan>& spans);

// Widget dump: [{from, to, html}, ...]
nlohmann::json decorationsToJson(const std::vector<furigana::ResolvedSpan>& spans);

/// Renders the final program output. `enabled` false means the mode is switched
/// off in the settings: html echoes the input, the JSON formats print no spans.
std::string formatOutput(OutputFormat format, std::string_view text, const std::vector<furigana::ResolvedSpan>& spans,
                         bool enabled);
