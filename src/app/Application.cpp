#include "Application.hpp"
#include "ConsoleSurfaces.hpp"
#include "config/ConfigManager.hpp"
#include "config/DownloadConfig.hpp"
#include "download/CprTransport.hpp"
#include "download/DownloadController.hpp"
#include "download/Version.hpp"
#include "package/ZipPackage.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>

#ifndef PKGDL_VERSION_STRING
#define PKGDL_VERSION_STRING "0.0.0"
#endif

namespace app
{

namespace
{

ConsoleProgressSurface* g_signal_target = nullptr;

extern "C" void onInterrupt(int)
{
    if (g_signal_target)
    {
        g_signal_target->requestCancel();
    }
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

std::string Application::usage()
{
    return "Usage: pkgdl <url> [--id ID] [--version VERSION] [--output PATH] [--config FILE] [--quiet]\n"
           "Downloads a package archive, showing progress. Press Ctrl+C to cancel.\n";
}

bool Application::parseCommandLine(int argc, char** argv, CommandLine& out, std::string& error)
{
    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];

        auto takeValue = [&](std::string& target) -> bool
        {
            if (i + 1 >= argc)
            {
                error = std::string("Missing value for ") + arg;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            out.showHelp = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0 || std::strcmp(arg, "-q") == 0)
        {
            out.quiet = true;
        }
        else if (std::strcmp(arg, "--id") == 0)
        {
            if (!takeValue(out.packageId))
                return false;
        }
        else if (std::strcmp(arg, "--version") == 0)
        {
            if (!takeValue(out.version))
                return false;
        }
        else if (std::strcmp(arg, "--output") == 0 || std::strcmp(arg, "-o") == 0)
        {
            if (!takeValue(out.outputPath))
                return false;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            if (!takeValue(out.configPath))
                return false;
        }
        else if (arg[0] == '-' && arg[1] != '\0')
        {
            error = std::string("Unknown option ") + arg;
            return false;
        }
        else if (out.locator.empty())
        {
            out.locator = arg;
        }
        else
        {
            error = std::string("Unexpected argument ") + arg;
            return false;
        }
    }

    if (out.locator.empty() && !out.showHelp)
    {
        error = "Missing package URL";
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(cmd_.configPath))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "Failed to initialize logging system", "");
        return false;
    }

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = "logs/pkgdl.log",
                                                  .append_override = std::nullopt,
                                                  .level_override = std::nullopt,
                                                  .max_file_size = 10 * 1024 * 1024,
                                                  .backup_count = 3,
                                                  .add_console_appender = false });
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(cmd_.configPath);
    download_config_ = std::make_unique<config::DownloadConfig>();
    download_config_->registerWith(*config_);
    config_->load();
}

void Application::installSignalHandler()
{
    g_signal_target = progress_.get();
    std::signal(SIGINT, onInterrupt);
}

void Application::reportPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::TakePending())
    {
        if (report.severity == utils::ErrorSeverity::Info)
            continue;
        std::cerr << utils::ErrorReporter::Describe(report) << '\n';
    }
}

int Application::run()
{
    std::string error;
    if (!parseCommandLine(argc_, argv_, cmd_, error))
    {
        std::cerr << error << "\n" << usage();
        return UsageError;
    }
    if (cmd_.showHelp)
    {
        std::cout << usage();
        return Success;
    }

    if (!initializeLogging())
    {
        reportPendingErrors();
        return Failure;
    }
    PLOG_INFO << "pkgdl " << PKGDL_VERSION_STRING << " starting";

    initializeConfig();

    progress_ = std::make_unique<ConsoleProgressSurface>(std::cerr, cmd_.quiet);
    installSignalHandler();

    ReporterErrorSink errorSink;
    ConsoleMainSurface mainSurface;
    download::CprTransport transport;

    download::DownloadController controller(*progress_, errorSink, mainSurface, transport,
                                            download_config_->toOptions(download::Version(PKGDL_VERSION_STRING)));

    auto package = controller.download(cmd_.locator, cmd_.packageId, cmd_.version);

    int exit_code = Success;
    if (package)
    {
        try
        {
            std::filesystem::path destination = cmd_.outputPath;
            if (destination.empty())
            {
                std::string locator_path = cmd_.locator.substr(0, cmd_.locator.find_first_of("?#"));
                std::filesystem::path name = std::filesystem::path(locator_path).filename();
                if (!cmd_.packageId.empty())
                {
                    name = cmd_.packageId + (cmd_.version.empty() ? "" : "." + cmd_.version) + ".nupkg";
                }
                else if (name.empty())
                {
                    name = "package.zip";
                }
                destination = name;
            }
            package->persistTo(destination);
            std::cout << package->path().string() << " (" << package->entryCount() << " entries, "
                      << package->sizeBytes() << " bytes)\n";
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Filesystem, "Failed to save package",
                                              e.what());
            exit_code = Failure;
        }
    }
    else if (controller.lastStatus() == download::FetchStatus::Cancelled)
    {
        std::cerr << "Download cancelled\n";
        exit_code = Cancelled;
    }
    else
    {
        exit_code = Failure;
    }

    reportPendingErrors();
    return exit_code;
}

void Application::cleanup()
{
    if (g_signal_target == progress_.get())
    {
        std::signal(SIGINT, SIG_DFL);
        g_signal_target = nullptr;
    }
    utils::LogManager::Shutdown();
}

} // namespace app
