#include "cli/vcdnet_cli.hpp"
#include "cli/confirmer.hpp"
#include "cli/output_sink.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "network/resource_locator.hpp"
#include "session/session_profile.hpp"
#include "session/session_provider.hpp"
#include <iostream>
#include <string>
#include <vector>

static const char* const kVersion = "1.0.0";

struct GlobalOptions {
    bool json = false;
    bool debug = false;
    bool help = false;
    bool version = false;
    std::string profilePath;
    std::string logPath;
};

// Consumes global options up to the first command word. Returns false on a
// malformed option and leaves the message in `error`.
static bool parseGlobalOptions(int argc, char** argv, GlobalOptions& options,
                               std::vector<std::string>& commandArgs, std::string& error) {
    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            break;
        }
        if (arg == "-j" || arg == "--json") {
            options.json = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--version") {
            options.version = true;
        } else if (arg == "--profile" || arg == "--log-file") {
            if (i + 1 >= argc) {
                error = "Option " + arg + " requires an argument";
                return false;
            }
            (arg == "--profile" ? options.profilePath : options.logPath) = argv[++i];
        } else {
            error = "No such option: " + arg;
            return false;
        }
    }

    for (; i < argc; i++) {
        commandArgs.push_back(argv[i]);
    }
    return true;
}

static void initializeLogging(const GlobalOptions& options) {
    LogLevel level = LogLevel::INFO;
    std::string levelName = utils::getEnv("VCDNET_LOG_LEVEL");
    if (!levelName.empty() && !Logger::parseLevel(levelName, level)) {
        std::cerr << "Ignoring unknown VCDNET_LOG_LEVEL: " << levelName << std::endl;
    }
    if (options.debug) {
        level = LogLevel::DEBUG;
    }

    std::string logPath = options.logPath.empty()
        ? utils::getEnv("VCDNET_LOG_FILE", "/tmp/vcdnet.log")
        : options.logPath;

    // A command still runs when its log file cannot be opened
    if (!Logger::initialize(logPath, level, options.debug)) {
        std::cerr << "Warning: logging disabled, cannot write " << logPath << std::endl;
    }
}

int main(int argc, char** argv) {
    GlobalOptions options;
    std::vector<std::string> commandArgs;
    std::string error;

    OutputSink usageSink(std::cout, std::cerr);
    if (!parseGlobalOptions(argc, argv, options, commandArgs, error)) {
        usageSink.printUsage(globalUsage());
        usageSink.printError(error);
        return VcdnetCli::kExitUsage;
    }

    if (options.version) {
        std::cout << "vcdnet version " << kVersion << std::endl;
        return VcdnetCli::kExitSuccess;
    }
    if (options.help) {
        usageSink.printUsage(globalUsage());
        return VcdnetCli::kExitSuccess;
    }

    initializeLogging(options);

    std::string profilePath = options.profilePath.empty() ? defaultProfilePath() : options.profilePath;
    Logger::debug("Using session profile: " + profilePath);

    OutputSink output(std::cout, std::cerr, options.json ? OutputFormat::Json : OutputFormat::Human);
    ProfileSessionProvider sessions(profilePath);
    VcdResourceLocator locator;
    StreamConfirmer confirmer(std::cin, std::cerr);

    VcdnetCli cli(CommandContext{sessions, locator, confirmer, output});

    int exitCode = VcdnetCli::kExitFailure;
    try {
        exitCode = cli.run(commandArgs);
    } catch (const std::exception& e) {
        Logger::fatal("Error in main: " + std::string(e.what()));
        output.printError(e.what());
        exitCode = VcdnetCli::kExitFailure;
    }

    Logger::shutdown();
    return exitCode;
}
