#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../furigana/Diagnostics.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Options LogManager::s_options;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Options& options)
{
    std::error_code ec;
    std::filesystem::create_directories(options.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to create log directory",
                                     options.directory + ": " + ec.message());
        return false;
    }

    s_options = options;
    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::AddChannel(const std::string& file_name, std::optional<plog::Severity> level)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logging used before initialization", file_name);
        return false;
    }

    const std::string path = (std::filesystem::path(s_options.directory) / file_name).string();
    try
    {
        if (!s_options.append)
            std::ofstream(path, std::ios::trunc).close();

        auto appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), s_options.max_file_size, s_options.backup_count);
        plog::init<InstanceId>(level.value_or(s_options.level), appender.get());
        s_appenders.push_back(std::move(appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot open log file " + path, ex.what());
        return false;
    }
}

template bool LogManager::AddChannel<0>(const std::string&, std::optional<plog::Severity>);
template bool LogManager::AddChannel<furigana::Diagnostics::kLogInstance>(const std::string&,
                                                                           std::optional<plog::Severity>);
#if FURIGANA_PROFILING_LEVEL >= 1
template bool LogManager::AddChannel<profiling::kProfilingLogInstance>(const std::string&,
                                                                        std::optional<plog::Severity>);
#endif

} // namespace utils
