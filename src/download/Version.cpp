#include "Version.hpp"

#include <regex>
#include <sstream>

namespace download
{

Version::Version()
    : major_(0)
    , minor_(0)
    , patch_(0)
{
}

Version::Version(int major, int minor, int patch, std::string prerelease)
    : major_(major)
    , minor_(minor)
    , patch_(patch)
    , prerelease_(std::move(prerelease))
{
}

Version::Version(const std::string& versionString)
    : Version()
{
    Version parsed;
    if (tryParse(versionString, parsed))
    {
        *this = std::move(parsed);
    }
}

std::string Version::toString() const
{
    std::ostringstream oss;
    oss << major_ << "." << minor_ << "." << patch_;
    if (!prerelease_.empty())
    {
        oss << "-" << prerelease_;
    }
    return oss.str();
}

std::strong_ordering Version::operator<=>(const Version& other) const
{
    if (auto cmp = major_ <=> other.major_; cmp != 0)
        return cmp;
    if (auto cmp = minor_ <=> other.minor_; cmp != 0)
        return cmp;
    if (auto cmp = patch_ <=> other.patch_; cmp != 0)
        return cmp;

    if (prerelease_.empty() != other.prerelease_.empty())
        return prerelease_.empty() ? std::strong_ordering::greater : std::strong_ordering::less;

    int cmp = prerelease_.compare(other.prerelease_);
    if (cmp < 0)
        return std::strong_ordering::less;
    if (cmp > 0)
        return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

bool Version::tryParse(const std::string& versionString, Version& outVersion)
{
    // Accepts "1", "1.2", "1.2.3", optional leading 'v' and "-label" suffix
    static const std::regex versionRegex(R"(^[vV]?(\d+)(?:\.(\d+))?(?:\.(\d+))?(?:-([0-9A-Za-z.\-]+))?$)");
    std::smatch match;
    if (!std::regex_match(versionString, match, versionRegex))
    {
        return false;
    }

    try
    {
        outVersion.major_ = std::stoi(match[1].str());
        outVersion.minor_ = match[2].matched ? std::stoi(match[2].str()) : 0;
        outVersion.patch_ = match[3].matched ? std::stoi(match[3].str()) : 0;
        outVersion.prerelease_ = match[4].matched ? match[4].str() : std::string();
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

} // namespace download
