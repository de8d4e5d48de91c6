#include "Application.hpp"
#include "CleaningJob.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/LanguageDetector.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../utils/Profile.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include <plog/Log.h>

#ifndef DIALOGCLEAN_VERSION_STRING
#define DIALOGCLEAN_VERSION_STRING "0.1.0"
#endif

namespace app
{

namespace
{

void PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " -c <config.toml> [OPTIONS]\n";
    std::cout << "dialogclean - dialogue corpus cleaner\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>  Configuration file (required)\n";
    std::cout << "  --verbose            Write per-stage diagnostics to the diagnostics log\n";
    std::cout << "  --version            Show version information\n";
    std::cout << "  --help               Show this help message\n";
}

void PrintVersion()
{
    std::cout << "dialogclean\n";
    std::cout << "Version: " << DIALOGCLEAN_VERSION_STRING << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

std::string diagnosticsLogPath(const std::string& main_log)
{
    std::filesystem::path path(main_log);
    std::string name = path.stem().string() + ".diagnostics" + path.extension().string();
    return path.replace_filename(name).string();
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            PrintUsage(argv_[0]);
            exit_early_ = true;
            return true;
        }
        else if (std::strcmp(arg, "--version") == 0)
        {
            PrintVersion();
            exit_early_ = true;
            return true;
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            opt_verbose_ = true;
        }
        else if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0)
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "ERROR: " << arg << " requires a file argument\n";
                return false;
            }
            config_path_ = argv_[++i];
        }
        else
        {
            std::cerr << "ERROR: unknown option '" << arg << "'\n";
            return false;
        }
    }

    if (config_path_.empty())
    {
        std::cerr << "ERROR: no configuration file given\n";
        return false;
    }
    return true;
}

bool Application::initializeConfig()
{
    PROFILE_SCOPE_FUNCTION();

    std::string error;
    if (!config::loadAppConfig(config_path_, config_, error))
    {
        PLOG_ERROR << "Configuration error: " << error;
        return false;
    }

    if (opt_verbose_)
        config_.logging.verbose = true;
    return true;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    const auto level = static_cast<plog::Severity>(config_.logging.level);
    utils::LogManager::ApplySettings(config_.logging.append, level);
    utils::LogManager::SetLevel(level);
    processing::Diagnostics::SetVerbose(config_.logging.verbose);

    if (!utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                .filepath = config_.logging.file,
                                                .append_override = std::nullopt,
                                                .level_override = std::nullopt,
                                                .max_file_size = 10 * 1024 * 1024,
                                                .backup_count = 3,
                                                .add_console_appender = false }))
        return false;

    return utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
        { .name = "diagnostics",
          .filepath = diagnosticsLogPath(config_.logging.file),
          .append_override = std::nullopt,
          .level_override = config_.logging.verbose ? plog::debug : level,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });
}

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        PrintUsage(argc_ > 0 ? argv_[0] : "dialogclean");
        return kExitConfigError;
    }
    if (exit_early_)
        return kExitSuccess;

    // Console first so configuration problems are visible
    if (!utils::LogManager::Initialize())
    {
        std::cerr << "ERROR: failed to initialize logging\n";
        return kExitConfigError;
    }

    if (!initializeConfig())
    {
        printErrorSummary();
        return kExitConfigError;
    }

    if (!initializeLogging())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "File logging unavailable, continuing with console only",
                                            config_.logging.file);
    }

    processing::DetectorFactory::Initialize(processing::DetectorSettings{});
    std::unique_ptr<processing::ILanguageDetector> detector = processing::DetectorFactory::Create();

    CleaningJob job(config_, *detector);
    std::optional<CleaningStats> stats = job.run();
    if (!stats)
    {
        printErrorSummary();
        return kExitFatal;
    }

    printStats(*stats);
    std::cout << "Output: " << job.outputPath() << "\n";
    printErrorSummary();
    return kExitSuccess;
}

void Application::printStats(const CleaningStats& stats) const
{
    std::cout << "Done!\n";
    std::cout << "  records read:  " << stats.read << "\n";
    std::cout << "  written:       " << stats.written << "\n";
    std::cout << "  rejected:      " << stats.rejected << "\n";
    std::cout << "  malformed:     " << stats.malformed << "\n";
    if (stats.failed > 0)
        std::cout << "  failed:        " << stats.failed << "\n";
}

void Application::printErrorSummary() const
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;

    constexpr std::size_t kMaxListed = 10;
    const std::size_t failures = utils::ErrorReporter::CountPending(utils::ErrorSeverity::Error);
    auto errors = utils::ErrorReporter::GetPendingErrors();

    std::cerr << "\n" << errors.size() << " issue(s) reported, " << failures << " error(s) or worse:\n";
    for (std::size_t i = 0; i < errors.size() && i < kMaxListed; ++i)
    {
        const auto& report = errors[i];
        std::cerr << "  [" << utils::ErrorReporter::SeverityToString(report.severity) << "] "
                  << utils::ErrorReporter::CategoryToString(report.category) << ": " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << "\n";
    }
    if (errors.size() > kMaxListed)
        std::cerr << "  ... and " << (errors.size() - kMaxListed) << " more, see the log file\n";
}

} // namespace app
