#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <iterator>
#include <utility>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_pending;

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    Push({ category, ErrorSeverity::Error, user_message, technical_details });
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    Push({ category, ErrorSeverity::Warning, user_message, technical_details });
}

void ErrorReporter::Push(ErrorReport report)
{
    const auto severity = report.severity == ErrorSeverity::Error ? plog::error : plog::warning;
    PLOG(severity) << "[" << CategoryToString(report.category) << "] " << report.user_message
                   << (report.technical_details.empty() ? "" : " | ") << report.technical_details;

    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.push_back(std::move(report));
    if (s_pending.size() > kMaxPending)
        s_pending.pop_front();
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_pending.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> out(std::make_move_iterator(s_pending.begin()), std::make_move_iterator(s_pending.end()));
    s_pending.clear();
    return out;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_pending.empty() ? ErrorReport{} : s_pending.back();
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.clear();
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string out = "[";
    out += SeverityToString(report.severity);
    out += "] ";
    out += report.user_message;
    if (!report.technical_details.empty())
    {
        out += ": ";
        out += report.technical_details;
    }
    return out;
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Tokenizer:
        return "Tokenizer";
    case ErrorCategory::Annotation:
        return "Annotation";
    default:
        return "Unknown";
    }
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    return severity == ErrorSeverity::Error ? "Error" : "Warning";
}

} // namespace utils
