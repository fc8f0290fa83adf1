#pragma once

#include <memory>
#include <string>

class ConfigManager;

namespace config
{
struct DownloadConfig;
}

namespace app
{

class ConsoleProgressSurface;

struct CommandLine
{
    std::string locator;
    std::string packageId;
    std::string version;
    std::string outputPath;
    std::string configPath = "pkgdl.toml";
    bool quiet = false;
    bool showHelp = false;
};

// Command line front end: pkgdl <url> [--id ID] [--version VER] [--output PATH] [--config FILE] [--quiet]
class Application
{
public:
    enum ExitCode
    {
        Success = 0,
        Failure = 1,
        UsageError = 2,
        Cancelled = 130
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

    // Returns false and fills error when the arguments are unusable
    static bool parseCommandLine(int argc, char** argv, CommandLine& out, std::string& error);
    static std::string usage();

private:
    bool initializeLogging();
    void initializeConfig();
    void installSignalHandler();
    void reportPendingErrors();
    void cleanup();

    int argc_;
    char** argv_;
    CommandLine cmd_;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<config::DownloadConfig> download_config_;
    std::unique_ptr<ConsoleProgressSurface> progress_;
};

} // namespace app
