#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

/**
 * @brief Sets up the plog instances as rolling files under one directory.
 *
 * Instance 0 is the run log, furigana::Diagnostics::kLogInstance carries the
 * verbose pipeline traces and profiling::kProfilingLogInstance the scope
 * timings. Nothing goes to the console because stdout carries program output.
 */
class LogManager
{
public:
    struct Options
    {
        std::string directory = "logs";
        bool append = true;                   // [global].append_logs
        plog::Severity level = plog::info;    // [app.debug].logging_level
        std::size_t max_file_size = 10 * 1024 * 1024;
        int backup_count = 3;
    };

    static bool Initialize(const Options& options);

    /// Opens <directory>/<file_name> for instance InstanceId
    template <int InstanceId = 0>
    static bool AddChannel(const std::string& file_name, std::optional<plog::Severity> level = std::nullopt);

private:
    static bool s_initialized;
    static Options s_options;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
