#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace furigana {

// Core data contracts for the annotation pipeline.
// Every stage consumes and produces these types; none of them outlive a call.

// One morpheme as reported by the tokenizer
struct Token {
    std::string surface;                      // Text exactly as it appears in the input
    std::optional<std::string> reading;       // Katakana reading; absent or "*" means "read as written"
};

// Parallel arrays: base_chunks[i] is read as reading_chunks[i]
struct AlignedSegment {
    std::vector<std::string> base_chunks;
    std::vector<std::string> reading_chunks;

    void append(std::string base, std::string reading)
    {
        base_chunks.push_back(std::move(base));
        reading_chunks.push_back(std::move(reading));
    }

    [[nodiscard]] std::size_t size() const noexcept { return base_chunks.size(); }
    [[nodiscard]] bool empty() const noexcept { return base_chunks.empty(); }

    bool operator==(const AlignedSegment&) const = default;
};

// Half-open byte range [from, to) into the source text
struct Interval {
    std::size_t from = 0;
    std::size_t to = 0;

    [[nodiscard]] std::size_t length() const noexcept { return to - from; }
    [[nodiscard]] bool overlaps(std::size_t other_from, std::size_t other_to) const noexcept
    {
        return from < other_to && other_from < to;
    }

    bool operator==(const Interval&) const = default;
};

// Region the resolver must leave untouched (selection, caret, code).
// from == to is a caret: it only excludes candidates that strictly contain it.
struct ExclusionZone {
    std::size_t from = 0;
    std::size_t to = 0;

    bool operator==(const ExclusionZone&) const = default;
};

enum class Origin {
    Manual,
    Automatic
};

struct Candidate {
    Interval interval;
    AlignedSegment segment;
    Origin origin = Origin::Automatic;
};

// Member of the final, ordered, non-overlapping output
struct ResolvedSpan {
    Interval interval;
    AlignedSegment segment;
    Origin origin = Origin::Automatic;

    bool operator==(const ResolvedSpan&) const = default;
};

[[nodiscard]] inline const char* originToString(Origin origin) noexcept
{
    return origin == Origin::Manual ? "manual" : "automatic";
}

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                               // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{0};    // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace furigana
