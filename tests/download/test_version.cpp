#include <catch2/catch_test_macros.hpp>

#include "download/UserAgent.hpp"
#include "download/Version.hpp"

using download::Version;

TEST_CASE("Version - parsing", "[download][version]") {
    SECTION("Full, partial and prefixed versions") {
        CHECK(Version("1.2.3").toString() == "1.2.3");
        CHECK(Version("v2.5").toString() == "2.5.0");
        CHECK(Version("7").toString() == "7.0.0");
        CHECK(Version("3.0.1-beta.2").prerelease() == "beta.2");
    }

    SECTION("Invalid strings") {
        Version out;
        CHECK_FALSE(Version::tryParse("", out));
        CHECK_FALSE(Version::tryParse("one.two", out));
        CHECK_FALSE(Version::tryParse("1.2.3.4", out));
        CHECK(Version("garbage") == Version(0, 0, 0));
    }
}

TEST_CASE("Version - ordering", "[download][version]") {
    CHECK(Version("1.2.3") < Version("1.10.0"));
    CHECK(Version("2.0.0") > Version("1.99.99"));
    CHECK(Version("1.0.0-rc1") < Version("1.0.0"));
    CHECK(Version("1.0.0-alpha") < Version("1.0.0-beta"));
    CHECK(Version("v1.2") == Version("1.2.0"));
}

TEST_CASE("User agent string", "[download][version]") {
    std::string agent = download::makeUserAgent("PackageExplorer", Version("4.1.0"));

    CHECK(agent.rfind("PackageExplorer/4.1.0 (", 0) == 0);
    CHECK(agent.back() == ')');
    CHECK(agent.find(download::platformName()) != std::string::npos);
}
