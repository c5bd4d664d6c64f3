#pragma once

#include <chrono>

// FURIGANA_PROFILING_LEVEL comes from CMake:
//   0 = macros compile to nothing
//   1 = scope timings logged to plog instance kProfilingLogInstance
//   2 = timings plus Tracy zones and thread names

#ifndef FURIGANA_PROFILING_LEVEL
#define FURIGANA_PROFILING_LEVEL 0
#endif

#if FURIGANA_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

#if FURIGANA_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

namespace profiling
{

constexpr int kProfilingLogInstance = 2;

#if FURIGANA_PROFILING_LEVEL >= 1
// Logs the wall time of the enclosing scope at debug level
class ScopeTimer
{
public:
    explicit ScopeTimer(const char* name) noexcept
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const auto us =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG_(kProfilingLogInstance) << "[profile] " << name_ << " " << us.count() << "us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    const char* name_;
    std::chrono::steady_clock::time_point start_;
};
#endif

} // namespace profiling

#if FURIGANA_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_CUSTOM(name) ((void)(name))
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_THREAD_NAME(name) ((void)(name))

#elif FURIGANA_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_CUSTOM(name) ::profiling::ScopeTimer profiling_scope_timer_(name)
#define PROFILE_SCOPE_FUNCTION() PROFILE_SCOPE_CUSTOM(__func__)
#define PROFILE_THREAD_NAME(name) ((void)(name))

#else
#define PROFILE_SCOPE_CUSTOM(name)                   \
    ZoneTransientN(profiling_zone_, (name), true); \
    ::profiling::ScopeTimer profiling_scope_timer_(name)
#define PROFILE_SCOPE_FUNCTION() PROFILE_SCOPE_CUSTOM(__func__)
#define PROFILE_THREAD_NAME(name) ::tracy::SetThreadName(name)
#endif
