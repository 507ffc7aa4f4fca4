#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    // Returns false and fills `error` when the section is invalid
    std::function<bool(const toml::table& section, std::string& error)> load;
};

class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb);

    /// Parses the config file and hands each registered section to its
    /// callback. Missing sections are passed as empty tables.
    bool load();
    bool loadFromString(std::string_view text);

    const toml::table& root() const;
    const std::string& configPath() const { return config_path_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    bool applyHandlers();
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
