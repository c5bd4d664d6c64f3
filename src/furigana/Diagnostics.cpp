#include "Diagnostics.hpp"

namespace furigana
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept { verbose_.store(enabled, std::memory_order_relaxed); }

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(bytes == 0 ? 1 : bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t cut = utf8Boundary(text, MaxPreview());

    std::string out;
    out.reserve(cut + 24);
    for (unsigned char c : text.substr(0, cut))
    {
        if (c == '\n')
            out += "\\n";
        else if (c == '\r')
            out += "\\r";
        else if (c == '\t')
            out += "\\t";
        else
            out.push_back(c < 0x20 || c == 0x7F ? '?' : static_cast<char>(c));
    }

    if (cut < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

// Largest cut <= limit that does not land on a UTF-8 continuation byte
std::size_t Diagnostics::utf8Boundary(std::string_view text, std::size_t limit) noexcept
{
    if (text.size() <= limit)
        return text.size();

    while (limit > 0 && (static_cast<unsigned char>(text[limit]) & 0xC0u) == 0x80u)
        --limit;
    return limit;
}

} // namespace furigana
