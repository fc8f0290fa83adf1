#pragma once

#include "download/DownloadController.hpp"
#include "download/Version.hpp"

#include <cstdint>
#include <string>

#include <toml++/toml.h>

class ConfigManager;

namespace config
{

// [download] section of pkgdl.toml
struct DownloadConfig
{
    static constexpr std::int64_t kMaxChunkSize = 1024 * 1024;

    std::int64_t chunk_size = 4096;
    std::int64_t poll_interval_ms = 200;
    std::int64_t connect_timeout_ms = 10000;
    std::int64_t timeout_ms = 0; // 0 = no deadline
    std::string user_agent_client = "PackageExplorer";
    std::string temp_directory; // empty = platform temp dir

    // Out-of-range values are reset to their defaults with a warning
    void applyTable(const toml::table& section);

    bool registerWith(ConfigManager& manager);

    download::DownloadOptions toOptions(const download::Version& productVersion) const;
};

} // namespace config
