#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Brings up the console logger on instance 0 so configuration errors are
    // visible before any file logger exists.
    static bool Initialize(plog::Severity console_level = plog::info);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void ApplySettings(bool append_logs, plog::Severity default_level);
    static void SetLevel(plog::Severity level);

    static void Shutdown();

    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();
    static bool PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
