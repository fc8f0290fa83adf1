#pragma once

#include "Version.hpp"

#include <string>

namespace download
{

// "{client}/{version} ({platform})", sent as User-Agent on every download
std::string makeUserAgent(const std::string& client, const Version& version);

// Name of the running platform, e.g. "Linux"
std::string platformName();

} // namespace download
