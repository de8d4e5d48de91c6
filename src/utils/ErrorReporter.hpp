#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace utils {

enum class ErrorCategory
{
    Initialization,    // logging, detector setup
    Configuration,     // TOML parsing, invalid config
    Input,             // unreadable input file, malformed records
    Output,            // output file creation and writes
    LanguageDetection, // classifier failures outside the expected "no features" case
    Normalization,     // text pipeline stage failures
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but the batch can continue
    Fatal    // Critical error, the run should stop
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message for the operator
    std::string technical_details; // Technical details for logs/bug reports
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Collects errors from the cleaning stages and queues them for the end-of-run
 * summary. Uses plog for logging, keeps a bounded queue.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Output, ErrorSeverity::Fatal,
 *                              "Cannot create output file",
 *                              "data/pippa_cleaned.jsonl");
 *
 *   // At the end of a run:
 *   if (ErrorReporter::HasPendingErrors()) {
 *       auto errors = ErrorReporter::GetPendingErrors();
 *       // Print summary...
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message Operator-facing message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a fatal error (logs and queues for the summary)
     */
    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a regular error
     */
    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a warning
     */
    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    /**
     * @brief Check if there are pending errors to display
     */
    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     * @return Vector of error reports
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Get the last error (for quick checks)
     */
    static ErrorReport GetLastError();

    /**
     * @brief Clear all pending errors without processing
     */
    static void ClearErrors();

    /**
     * @brief Count queued reports at or above the given severity
     */
    static std::size_t CountPending(ErrorSeverity min_severity);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    /**
     * @brief Get current timestamp as a formatted string
     */
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
