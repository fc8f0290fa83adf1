#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, SectionHandler handler)
{
    for (const auto& entry : handlers_)
    {
        if (entry.path == path)
        {
            last_error_ = "Duplicate handler for config section '" + path + "'";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(handler) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No config file at " << config_path_ << ", using defaults";
        applyDefaults();
        return true;
    }

    try
    {
        bool ok = apply(toml::parse(ifs, config_path_));
        PLOG_INFO << "Loaded config from " << config_path_;
        return ok;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                            std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + config_path_);
        applyDefaults();
        return false;
    }
}

bool ConfigManager::loadFromString(std::string_view text)
{
    last_error_.clear();
    try
    {
        return apply(toml::parse(text));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;
        applyDefaults();
        return false;
    }
}

bool ConfigManager::apply(toml::table table)
{
    root_ = std::make_unique<toml::table>(std::move(table));

    for (const auto& entry : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, entry.path);
        if (section)
        {
            entry.handler(*section);
        }
        else
        {
            toml::table empty;
            entry.handler(empty);
        }
    }
    return true;
}

void ConfigManager::applyDefaults()
{
    apply(toml::table{});
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;

        auto* tbl = it->second.as_table();
        if (!tbl)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }

        current = tbl;
    }

    return current;
}
