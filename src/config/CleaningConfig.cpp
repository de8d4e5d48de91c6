#include "CleaningConfig.hpp"
#include "ConfigManager.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace config
{

namespace
{

bool readString(const toml::table& section, const char* key, std::string& out, std::string& error)
{
    auto node = section[key];
    if (!node)
        return true;
    if (!node.is_string())
    {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = node.value_or(std::string());
    return true;
}

bool readBool(const toml::table& section, const char* key, bool& out, std::string& error)
{
    auto node = section[key];
    if (!node)
        return true;
    if (!node.is_boolean())
    {
        error = std::string("'") + key + "' must be true or false";
        return false;
    }
    out = node.value_or(out);
    return true;
}

bool readInteger(const toml::table& section, const char* key, long long& out, std::string& error)
{
    auto node = section[key];
    if (!node)
        return true;
    if (!node.is_integer())
    {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    out = node.value_or(out);
    return true;
}

bool loadCleaning(const toml::table& section, CleaningConfig& cfg, std::string& error)
{
    if (!readString(section, "pippa_file", cfg.pippa_file, error) ||
        !readString(section, "data_dir", cfg.data_dir, error) ||
        !readString(section, "output_file", cfg.output_file, error) ||
        !readString(section, "target_language", cfg.target_language, error))
        return false;

    if (cfg.pippa_file.empty())
    {
        error = "'pippa_file' is required";
        return false;
    }

    auto threshold = section["language_threshold"];
    if (!threshold)
    {
        error = "'language_threshold' is required";
        return false;
    }
    if (!threshold.is_number())
    {
        error = "'language_threshold' must be a number";
        return false;
    }
    cfg.language_threshold = threshold.value_or(-1.0);
    if (!(cfg.language_threshold >= 0.0 && cfg.language_threshold <= 1.0))
    {
        error = "'language_threshold' must be within [0, 1], got " + std::to_string(cfg.language_threshold);
        return false;
    }

    if (cfg.target_language.empty())
    {
        error = "'target_language' must not be empty";
        return false;
    }

    long long workers = static_cast<long long>(cfg.workers);
    if (!readInteger(section, "workers", workers, error))
        return false;
    if (workers < 0)
    {
        error = "'workers' must not be negative";
        return false;
    }
    cfg.workers = static_cast<std::size_t>(workers);
    return true;
}

bool loadLogging(const toml::table& section, LoggingConfig& cfg, std::string& error)
{
    long long level = cfg.level;
    if (!readInteger(section, "level", level, error) || !readString(section, "file", cfg.file, error) ||
        !readBool(section, "append", cfg.append, error) || !readBool(section, "verbose", cfg.verbose, error))
        return false;

    if (level < 0 || level > 6)
    {
        error = "'level' must be a plog severity between 0 and 6";
        return false;
    }
    cfg.level = static_cast<int>(level);
    return true;
}

} // namespace

bool loadAppConfig(const std::string& path, AppConfig& out, std::string& error)
{
    AppConfig loaded;
    ConfigManager manager(path);

    manager.registerTable("cleaning",
                          TableCallbacks{ [&loaded](const toml::table& section, std::string& err)
                                          { return loadCleaning(section, loaded.cleaning, err); } },
                          { "pippa_file", "language_threshold", "data_dir", "output_file", "target_language",
                            "workers" });
    manager.registerTable("logging",
                          TableCallbacks{ [&loaded](const toml::table& section, std::string& err)
                                          { return loadLogging(section, loaded.logging, err); } },
                          { "level", "file", "append", "verbose" });

    if (!manager.load())
    {
        error = manager.lastError();
        return false;
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    loaded.config_dir = (ec ? fs::path(path) : absolute).parent_path().string();

    out = std::move(loaded);
    return true;
}

std::string resolveDataDir(const AppConfig& config)
{
    fs::path dir(config.cleaning.data_dir);
    if (dir.is_absolute() || config.config_dir.empty())
        return dir.lexically_normal().string();
    return (fs::path(config.config_dir) / dir).lexically_normal().string();
}

} // namespace config
