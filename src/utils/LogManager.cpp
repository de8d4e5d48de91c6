#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(plog::Severity console_level)
{
    if (s_initialized)
        return true;

    try
    {
        auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
        plog::init<0>(console_level, console_appender.get());
        s_appenders.push_back(std::move(console_appender));
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to initialize console logger", ex.what());
        return false;
    }

    s_default_level = console_level;
    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    if (!PrepareLogDirectory(config.filepath))
        return false;

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::Severity level = config.level_override.value_or(s_default_level);

        // Instance 0 already owns the console appender from Initialize()
        if (auto logger = plog::get<InstanceId>())
        {
            logger->addAppender(file_appender.get());
            logger->setMaxSeverity(level);
        }
        else
        {
            plog::init<InstanceId>(level, file_appender.get());
        }

        if (config.add_console_appender && InstanceId != 0)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

void LogManager::ApplySettings(bool append_logs, plog::Severity default_level)
{
    s_append_logs = append_logs;
    s_default_level = default_level;
}

void LogManager::SetLevel(plog::Severity level)
{
    s_default_level = level;
    if (auto* logger = plog::get())
    {
        logger->setMaxSeverity(level);
    }
    if (auto* diag_logger = plog::get<processing::Diagnostics::kLogInstance>())
    {
        diag_logger->setMaxSeverity(level);
    }
}

void LogManager::Shutdown()
{
    // plog keeps raw pointers to the appenders; silence the loggers before
    // releasing them.
    if (auto* logger = plog::get())
    {
        logger->setMaxSeverity(plog::none);
    }
    if (auto* diag_logger = plog::get<processing::Diagnostics::kLogInstance>())
    {
        diag_logger->setMaxSeverity(plog::none);
    }
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    auto parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     parent.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
