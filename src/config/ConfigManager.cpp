#include "ConfigManager.hpp"
#include "RunConfig.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <utility>

#include <plog/Log.h>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        auto clash = std::find_first_of(ownedKeys.begin(), ownedKeys.end(), handler.ownedKeys.begin(),
                                        handler.ownedKeys.end());
        if (clash != ownedKeys.end())
        {
            last_error_ = "Duplicate ownership: key '" + *clash + "' at path '" + path + "' already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    warnings_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        last_error_ = "Cannot open config file: " + config_path_;
        return false;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));

        for (const auto& handler : handlers_)
        {
            const toml::table* section = resolveTablePath(*root_, handler.path);
            if (!section)
                continue;

            for (const auto& [key, value] : *section)
            {
                const auto& owned = handler.ownedKeys;
                if (std::find(owned.begin(), owned.end(), key.str()) == owned.end())
                    warnings_.push_back("Unknown key '" + std::string(key.str()) + "' in [" + handler.path + "] of " +
                                        config_path_);
            }

            handler.callbacks.load(*section);
        }

        PLOG_DEBUG << "Loaded config from " << config_path_;
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        if (pe.source().begin.line > 0)
        {
            last_error_ = "config parse error at line " + std::to_string(pe.source().begin.line) + ": " +
                          std::string(pe.description());
        }
        else
        {
            last_error_ = std::string("config parse error: ") + std::string(pe.description());
        }
        return false;
    }
    catch (const std::invalid_argument& ex)
    {
        last_error_ = std::string("invalid config value: ") + ex.what();
        return false;
    }
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

void ConfigManager::bindRunConfig(RunConfig& config)
{
    registerTable("files",
                  { .load =
                        [&config](const toml::table& section)
                        {
                            if (auto* list = section["extensions"].as_array())
                            {
                                std::vector<std::string> extensions;
                                for (const auto& node : *list)
                                {
                                    auto ext = node.value<std::string>();
                                    if (!ext)
                                        throw std::invalid_argument("files.extensions must contain strings");
                                    extensions.push_back(*ext);
                                }
                                if (extensions.empty())
                                    throw std::invalid_argument("files.extensions must not be empty");
                                config.extensions = std::move(extensions);
                            }
                            else if (section.contains("extensions"))
                            {
                                throw std::invalid_argument("files.extensions must be an array");
                            }

                            if (section.contains("backup_suffix"))
                            {
                                auto suffix = section["backup_suffix"].value<std::string>();
                                if (!suffix || suffix->empty())
                                    throw std::invalid_argument("files.backup_suffix must be a non-empty string");
                                config.backup_suffix = *suffix;
                            }

                            if (section.contains("atomic_writes"))
                            {
                                auto atomic = section["atomic_writes"].value<bool>();
                                if (!atomic)
                                    throw std::invalid_argument("files.atomic_writes must be a boolean");
                                config.atomic_writes = *atomic;
                            }
                        } },
                  { "extensions", "backup_suffix", "atomic_writes" });

    registerTable("log",
                  { .load =
                        [&config](const toml::table& section)
                        {
                            if (section.contains("level"))
                            {
                                auto name = section["level"].value<std::string>();
                                auto level = name ? ParseSeverity(*name) : std::nullopt;
                                if (!level)
                                    throw std::invalid_argument("log.level must be one of none, fatal, error, "
                                                                "warning, info, debug, verbose");
                                config.log_level = *level;
                            }

                            if (auto file = section["file"].value<std::string>())
                                config.log_file = *file;
                        } },
                  { "level", "file" });
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path)
{
    if (path.empty())
        return &root;

    // Dotted path, e.g. "files" or "outer.inner"; anything but a table is ignored
    const toml::table* section = root.at_path(path).as_table();
    if (!section && root.at_path(path))
        warnings_.push_back("[" + path + "] in " + config_path_ + " is not a table");
    return section;
}
