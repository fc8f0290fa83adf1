#pragma once

#include <compare>
#include <string>

namespace download
{

// Semantic version: major.minor.patch with an optional pre-release label ("1.2.3-beta")
class Version
{
public:
    Version();
    Version(int major, int minor, int patch, std::string prerelease = {});

    // Falls back to 0.0.0 when the string cannot be parsed
    explicit Version(const std::string& versionString);

    int major() const { return major_; }
    int minor() const { return minor_; }
    int patch() const { return patch_; }
    const std::string& prerelease() const { return prerelease_; }

    // "1.2.3" or "1.2.3-beta"
    std::string toString() const;

    // Pre-release versions order before the matching release
    std::strong_ordering operator<=>(const Version& other) const;
    bool operator==(const Version& other) const = default;

    static bool tryParse(const std::string& versionString, Version& outVersion);

private:
    int major_;
    int minor_;
    int patch_;
    std::string prerelease_;
};

} // namespace download
