#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

// Loads pkgdl.toml and hands each registered section to its handler.
// Sections that are missing from the file are delivered as empty tables so handlers
// always get a chance to apply their defaults.
class ConfigManager
{
public:
    using SectionHandler = std::function<void(const toml::table& section)>;

    explicit ConfigManager(std::string config_path = "pkgdl.toml");
    ~ConfigManager();

    // path is dotted, e.g. "download" or "app.debug"
    bool registerTable(const std::string& path, SectionHandler handler);

    // Missing file is not an error. Returns false on parse errors (handlers still get defaults).
    bool load();
    bool loadFromString(std::string_view text);

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(toml::table table);
    void applyDefaults();
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    struct HandlerEntry
    {
        std::string path;
        SectionHandler handler;
    };

    std::string config_path_;
    std::string last_error_;
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
