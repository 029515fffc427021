#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace utils {

enum class ErrorCategory
{
    Configuration, // missing or invalid settings, fatal before any network call
    Fetch,         // network, timeout or non-2xx on the watched page
    Notify,        // mail transport or provider-side failure
    Persist,       // snapshot read/write failure
    Unknown
};

enum class ErrorSeverity
{
    Info,     // Informational, no action needed
    Warning,  // Degraded run, state still consistent
    Error,    // Operation failed, run reports it
    Critical, // Stored state is stale or unreadable, needs operator attention
    Fatal     // Run cannot proceed
};

struct ErrorReport
{
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;           // Operator-facing summary
    std::string technical_details; // URL, stage, provider response
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string tech_details);
};

/**
 * @brief Categorized error sink for one watcher run
 *
 * Every report is written through plog immediately and kept in a bounded
 * queue so the application can print a summary when the run ends.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Fetch,
 *                              "Failed to fetch page",
 *                              "url=https://example.com stage=FETCHING HTTP 503");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                            const std::string& message,
                            const std::string& technical_details = "");

    static void ReportCritical(ErrorCategory category,
                               const std::string& message,
                               const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending reports and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    /**
     * @brief Local time as "YYYY-MM-DD HH:MM:SS"
     */
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
