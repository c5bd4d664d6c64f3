#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace furigana
{

// Verbose pipeline tracing on its own plog instance, plus log-safe text previews
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static std::size_t utf8Boundary(std::string_view text, std::size_t limit) noexcept;
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace furigana
