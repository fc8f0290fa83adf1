#include <catch2/catch_test_macros.hpp>

#include "app/Application.hpp"

#include <string>
#include <vector>

using app::Application;
using app::CommandLine;

namespace {

bool parse(std::vector<std::string> args, CommandLine& out, std::string& error) {
    args.insert(args.begin(), "pkgdl");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return Application::parseCommandLine(static_cast<int>(argv.size()), argv.data(), out, error);
}

}  // namespace

TEST_CASE("Command line parsing", "[app]") {
    CommandLine cmd;
    std::string error;

    SECTION("URL with package identity") {
        REQUIRE(parse({"https://example.org/Foo.1.2.3.nupkg", "--id", "Foo", "--version", "1.2.3", "-o",
                       "out/Foo.nupkg", "--quiet"},
                      cmd, error));
        CHECK(cmd.locator == "https://example.org/Foo.1.2.3.nupkg");
        CHECK(cmd.packageId == "Foo");
        CHECK(cmd.version == "1.2.3");
        CHECK(cmd.outputPath == "out/Foo.nupkg");
        CHECK(cmd.quiet);
        CHECK(cmd.configPath == "pkgdl.toml");
    }

    SECTION("Help needs no URL") {
        REQUIRE(parse({"--help"}, cmd, error));
        CHECK(cmd.showHelp);
    }

    SECTION("Missing URL") {
        CHECK_FALSE(parse({"--id", "Foo"}, cmd, error));
        CHECK(error == "Missing package URL");
    }

    SECTION("Option without value") {
        CHECK_FALSE(parse({"https://example.org/x", "--config"}, cmd, error));
        CHECK(error == "Missing value for --config");
    }

    SECTION("Unknown option") {
        CHECK_FALSE(parse({"https://example.org/x", "--resume"}, cmd, error));
        CHECK(error == "Unknown option --resume");
    }

    SECTION("Second positional argument") {
        CHECK_FALSE(parse({"https://example.org/x", "https://example.org/y"}, cmd, error));
    }
}
