#include "DownloadConfig.hpp"
#include "ConfigManager.hpp"
#include "download/UserAgent.hpp"

#include <plog/Log.h>

namespace config
{

namespace
{

std::int64_t readBounded(const toml::table& section, const char* key, std::int64_t fallback, std::int64_t min,
                         std::int64_t max)
{
    auto node = section[key];
    if (!node)
        return fallback;

    auto value = node.value<std::int64_t>();
    if (!value || *value < min || *value > max)
    {
        PLOG_WARNING << "download." << key << " must be an integer in [" << min << ", " << max
                     << "], using " << fallback;
        return fallback;
    }
    return *value;
}

} // namespace

void DownloadConfig::applyTable(const toml::table& section)
{
    const DownloadConfig defaults;

    chunk_size = readBounded(section, "chunk_size", defaults.chunk_size, 1, kMaxChunkSize);
    poll_interval_ms = readBounded(section, "poll_interval_ms", defaults.poll_interval_ms, 1, 60000);
    connect_timeout_ms = readBounded(section, "connect_timeout_ms", defaults.connect_timeout_ms, 0, 600000);
    timeout_ms = readBounded(section, "timeout_ms", defaults.timeout_ms, 0, 24 * 3600 * 1000LL);

    user_agent_client = section["user_agent_client"].value_or(defaults.user_agent_client);
    if (user_agent_client.empty())
    {
        user_agent_client = defaults.user_agent_client;
    }
    temp_directory = section["temp_directory"].value_or(defaults.temp_directory);
}

bool DownloadConfig::registerWith(ConfigManager& manager)
{
    return manager.registerTable("download", [this](const toml::table& section) { applyTable(section); });
}

download::DownloadOptions DownloadConfig::toOptions(const download::Version& productVersion) const
{
    download::DownloadOptions options;
    options.pollInterval = std::chrono::milliseconds(poll_interval_ms);
    options.transfer.chunkSize = static_cast<std::size_t>(chunk_size);
    options.transfer.tempDirectory = temp_directory;
    options.transfer.request.userAgent = download::makeUserAgent(user_agent_client, productVersion);
    options.transfer.request.connectTimeoutMs = static_cast<int>(connect_timeout_ms);
    options.transfer.request.timeoutMs = static_cast<int>(timeout_ms);
    return options;
}

} // namespace config
