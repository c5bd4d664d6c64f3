#pragma once

#include "Diagnostics.hpp"
#include "FuriganaTypes.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include <plog/Log.h>

namespace furigana {

/// Runs one annotation stage. An exception thrown by the stage becomes a failed
/// StageResult and an Annotation warning, so the caller degrades instead of unwinding.
template<typename Fn, typename T = std::invoke_result_t<Fn&>>
StageResult<T> runStage(const char* stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    const auto start = std::chrono::steady_clock::now();
    const auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    };

    try
    {
        auto stage = StageResult<T>::success(fn(), elapsed(), stage_name);
        if (Diagnostics::IsVerbose())
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "[stage] " << stage_name << " ok in " << stage.duration.count() << "us";
        return stage;
    }
    catch (const std::exception& ex)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[stage] " << stage_name << " threw: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Annotation,
                                            std::string("Annotation stage '") + stage_name + "' failed, its spans are skipped",
                                            ex.what());
        return StageResult<T>::failure(ex.what(), elapsed(), stage_name);
    }
}

/// Payload of a successful stage, an empty value otherwise
template<typename T>
T takeOrEmpty(StageResult<T>&& stage)
{
    return stage.succeeded ? std::move(stage.result) : T{};
}

} // namespace furigana
