#pragma once

#include <cstddef>
#include <string>

namespace config
{

struct CleaningConfig
{
    std::string pippa_file;               // input, relative to data_dir
    double language_threshold = -1.0;     // required; max fraction of non-target turns
    std::string data_dir = "data";        // relative paths resolve against the config file directory
    std::string output_file;              // empty: derived from pippa_file
    std::string target_language = "en";
    std::size_t workers = 1;              // 0 = hardware concurrency
};

struct LoggingConfig
{
    int level = 4; // plog::Severity, 4 = info
    std::string file = "logs/dialogclean.log";
    bool append = true;
    bool verbose = false;
};

struct AppConfig
{
    CleaningConfig cleaning;
    LoggingConfig logging;
    std::string config_dir; // directory of the loaded config file
};

// Parses and validates the TOML file at path. On failure returns false and
// describes the first problem in error.
bool loadAppConfig(const std::string& path, AppConfig& out, std::string& error);

// data_dir resolved against the config directory
std::string resolveDataDir(const AppConfig& config);

} // namespace config
