#pragma once

#include "../config/CleaningConfig.hpp"

#include <string>

namespace app
{

struct CleaningStats;

// Command line front end: dialogclean -c <config.toml> [--verbose]
class Application
{
public:
    enum ExitCode
    {
        kExitSuccess = 0,
        kExitConfigError = 1, // bad usage or configuration
        kExitFatal = 2        // input/output failure
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    // Returns false on a usage error; sets exit_early_ for --help/--version
    bool parseCommandLineArgs();
    bool initializeLogging();
    bool initializeConfig();

    void printStats(const CleaningStats& stats) const;
    void printErrorSummary() const;

    int argc_ = 0;
    char** argv_ = nullptr;

    std::string config_path_;
    bool opt_verbose_ = false;
    bool exit_early_ = false;

    config::AppConfig config_;
};

} // namespace app
