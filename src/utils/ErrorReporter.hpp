#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logging, command line, input files
    Configuration,  // TOML parsing, saving
    Tokenizer,      // Dictionary load, build timeout
    Annotation,     // A pipeline stage threw
    Unknown
};

enum class ErrorSeverity
{
    Warning, // Output is degraded but still produced
    Error    // The operation failed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string user_message;
    std::string technical_details;
};

/**
 * @brief Process-wide queue of problems for the front end to show.
 *
 * The engine never fails a call because of a broken stage or tokenizer. It
 * degrades and leaves a report here instead. Every report is also logged
 * through plog. The queue keeps the newest kMaxPending entries.
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxPending = 100;

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();
    /// Drains the queue, oldest first
    static std::vector<ErrorReport> GetPendingErrors();
    /// Newest pending report, or a default one when the queue is empty
    static ErrorReport GetLastError();
    static void ClearErrors();

    /// "[Severity] message: details", the form printed on stderr
    static std::string Format(const ErrorReport& report);

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

private:
    static void Push(ErrorReport report);

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_pending;
};

} // namespace utils
