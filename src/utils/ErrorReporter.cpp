#include "ErrorReporter.hpp"
#include <plog/Log.h>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <ctime>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
    , is_fatal(sev == ErrorSeverity::Fatal)
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, user_message, technical_details);

    std::string log_msg = "[" + CategoryToString(category) + "] " + user_message;
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
    case ErrorSeverity::Fatal:
        PLOG_FATAL << log_msg;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.push_back(std::move(report));

    // Limit queue size to prevent memory growth
    if (s_error_queue.size() > MAX_QUEUE_SIZE)
    {
        s_error_queue.erase(s_error_queue.begin());
    }
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors = std::move(s_error_queue);
    s_error_queue.clear();
    return errors;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_error_queue.empty())
    {
        return ErrorReport();
    }
    return s_error_queue.back();
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

std::size_t ErrorReporter::CountPending(ErrorSeverity min_severity)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return static_cast<std::size_t>(std::count_if(s_error_queue.begin(), s_error_queue.end(),
                                                   [min_severity](const ErrorReport& report)
                                                   {
                                                       return report.severity >= min_severity;
                                                   }));
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::Output:
        return "Output";
    case ErrorCategory::LanguageDetection:
        return "Language Detection";
    case ErrorCategory::Normalization:
        return "Normalization";
    case ErrorCategory::Unknown:
        return "Unknown";
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
    case ErrorSeverity::Fatal:
        return "Fatal";
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::GetTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
