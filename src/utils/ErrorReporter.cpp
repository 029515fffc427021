#include "ErrorReporter.hpp"
#include "Timestamp.hpp"

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , message(std::move(msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, message, technical_details);

    std::string log_msg = "[" + CategoryToString(category) + "] " + message;
    if (!technical_details.empty())
    {
        log_msg += " | Details: " + technical_details;
    }

    switch (severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << log_msg;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << log_msg;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << log_msg;
        break;
    case ErrorSeverity::Critical:
        PLOG_FATAL << "[CRITICAL] " << log_msg;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << log_msg;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.push_back(std::move(report));

    if (s_error_queue.size() > MAX_QUEUE_SIZE)
    {
        s_error_queue.erase(s_error_queue.begin());
    }
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, message, technical_details);
}

void ErrorReporter::ReportCritical(ErrorCategory category, const std::string& message,
                                   const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Critical, message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors;
    errors.swap(s_error_queue);
    return errors;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Fetch:
        return "Fetch";
    case ErrorCategory::Notify:
        return "Notify";
    case ErrorCategory::Persist:
        return "Persist";
    case ErrorCategory::Unknown:
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Critical:
        return "Critical";
    case ErrorSeverity::Fatal:
        return "Fatal";
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::GetTimestamp() { return format_local_time(std::chrono::system_clock::now(), false); }

} // namespace utils
