#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    // Returns false and fills error when the section holds invalid values
    std::function<bool(const toml::table& section, std::string& error)> load;
};

class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path);
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    void warnUnknownKeys(const toml::table& section, const std::string& path,
                         const std::vector<std::string>& ownedKeys) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
