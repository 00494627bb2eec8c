#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

struct RunConfig;

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Loads an explicit --config TOML file and hands each registered table to its owner.
// The file is only ever read; nothing is written back.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path);
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    const toml::table& root() const;

    const char* lastError() const { return last_error_.c_str(); }

    // Non-fatal findings from the last load(), e.g. unknown keys. Kept here because
    // the config is read before the logger is up; the caller logs them.
    const std::vector<std::string>& warnings() const { return warnings_; }

    // Registers the [files] and [log] tables against @p config
    void bindRunConfig(RunConfig& config);

private:
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path);

    std::string config_path_;
    std::string last_error_;
    std::vector<std::string> warnings_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
