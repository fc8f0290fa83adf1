#include "UserAgent.hpp"

#ifndef _WIN32
#include <sys/utsname.h>
#endif

namespace download
{

std::string platformName()
{
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#else
    struct utsname info{};
    if (uname(&info) == 0)
    {
        return std::string(info.sysname) + " " + info.release;
    }
    return "Linux";
#endif
}

std::string makeUserAgent(const std::string& client, const Version& version)
{
    return client + "/" + version.toString() + " (" + platformName() + ")";
}

} // namespace download
