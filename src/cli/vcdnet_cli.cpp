#include "cli/vcdnet_cli.hpp"
#include "common/logger.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string globalUsage() {
    std::ostringstream usage;
    usage << "Usage: vcdnet [options] network <group> <command> [arguments]\n"
          << "\n"
          << "Options:\n"
          << "  -j, --json            Print results as JSON\n"
          << "  --profile <path>      Session profile (default ~/.vcdnet/profile.json)\n"
          << "  --log-file <path>     Log file (default /tmp/vcdnet.log)\n"
          << "  --debug               Log at DEBUG level and echo log lines to stderr\n"
          << "  -h, --help            Show this help message\n"
          << "  --version             Show version information\n"
          << "\n"
          << "Commands:\n"
          << "  network               " << kRootShortHelp << "\n";
    return usage.str();
}

VcdnetCli::VcdnetCli(CommandContext context)
    : context_(context) {
}

void VcdnetCli::printUsage() const {
    context_.output.printUsage(globalUsage());
}

int VcdnetCli::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        return usageError("No command specified", globalUsage());
    }
    if (args[0] == "-h" || args[0] == "--help") {
        printUsage();
        return kExitSuccess;
    }
    if (args[0] != kRootCommand) {
        return usageError("No such command '" + args[0] + "'", globalUsage());
    }

    if (args.size() < 2) {
        return usageError("Missing command group", rootUsage());
    }
    if (args[1] == "-h" || args[1] == "--help") {
        context_.output.printUsage(rootUsage());
        return kExitSuccess;
    }

    const CommandGroup* group = findCommandGroup(args[1]);
    if (!group) {
        return usageError("No such command 'network " + args[1] + "'", rootUsage());
    }

    if (args.size() < 3) {
        return usageError("Missing command", groupUsage(*group));
    }
    if (args[2] == "-h" || args[2] == "--help") {
        context_.output.printUsage(groupUsage(*group));
        return kExitSuccess;
    }

    const CommandSpec* command = findCommand(group->name, args[2]);
    if (!command) {
        return usageError("No such command 'network " + group->name + " " + args[2] + "'", groupUsage(*group));
    }

    return runCommand(*command, std::vector<std::string>(args.begin() + 3, args.end()));
}

int VcdnetCli::runCommand(const CommandSpec& command, const std::vector<std::string>& args) {
    std::string path = std::string(kRootCommand) + " " + command.group + " " + command.name;
    Logger::info("Running command: " + path);

    ParsedArguments parsed;
    OperationStatus status = parseCommandLine(command.arguments, command.options, args, parsed);
    if (!status) {
        return finish(path, status);
    }
    if (parsed.helpRequested()) {
        context_.output.printUsage(commandUsage(command));
        return kExitSuccess;
    }

    try {
        status = command.handler(context_, parsed);
    } catch (const std::exception& e) {
        Logger::error("Unexpected error in " + path + ": " + std::string(e.what()));
        status = OperationStatus::failure(ErrorKind::RemoteRejected, e.what());
    }
    return finish(path, status);
}

int VcdnetCli::usageError(const std::string& message, const std::string& usage) {
    Logger::error(message);
    context_.output.printUsage(usage);
    context_.output.printError(message);
    return kExitUsage;
}

int VcdnetCli::finish(const std::string& path, const OperationStatus& status) {
    if (status.ok()) {
        Logger::info("Command completed: " + path);
        return kExitSuccess;
    }

    Logger::error(path + " failed (" + errorKindToString(status.kind) + "): " + status.message);
    context_.output.printError(status.message);

    if (status.kind == ErrorKind::ValidationError || status.kind == ErrorKind::UsageError) {
        return kExitUsage;
    }
    return kExitFailure;
}

std::string VcdnetCli::rootUsage() const {
    std::ostringstream usage;
    usage << "Usage: vcdnet network <group> <command> [arguments]\n"
          << "\n"
          << "  Work with networks in vCloud Director.\n"
          << "\n"
          << "Groups:\n";
    for (const auto& group : commandGroups()) {
        usage << "  " << std::left << std::setw(12) << group.name << group.shortHelp << "\n";
    }
    return usage.str();
}

std::string VcdnetCli::groupUsage(const CommandGroup& group) const {
    std::ostringstream usage;
    usage << "Usage: vcdnet network " << group.name << " <command> [arguments]\n"
          << "\n"
          << group.help
          << "\n"
          << "Commands:\n";
    for (const auto& command : commandTable()) {
        if (command.group == group.name) {
            usage << "  " << std::left << std::setw(10) << command.name << command.shortHelp << "\n";
        }
    }
    return usage.str();
}

std::string VcdnetCli::commandUsage(const CommandSpec& command) const {
    std::ostringstream usage;
    usage << "Usage: vcdnet network " << command.group << " " << command.name;
    for (const auto& argument : command.arguments) {
        usage << " " << argument.metavar;
    }
    if (!command.options.empty()) {
        usage << " [options]";
    }
    usage << "\n\n  " << command.shortHelp << "\n";

    if (!command.options.empty()) {
        usage << "\nOptions:\n";
        for (const auto& option : command.options) {
            std::string names = option.shortName.empty() ? option.name : option.shortName + ", " + option.name;
            if (option.kind == OptionKind::Toggle) {
                std::string negated = option.negatedShortName.empty()
                    ? option.negatedName
                    : option.negatedShortName + ", " + option.negatedName;
                names += " / " + negated;
            } else if (option.kind == OptionKind::Value || option.kind == OptionKind::Repeatable) {
                names += " " + option.metavar;
            }
            std::string help = option.help;
            if (option.required) {
                help += " [required]";
            }
            if (option.kind == OptionKind::Repeatable) {
                help += " [repeatable]";
            }
            usage << "  " << std::left << std::setw(40) << names << help << "\n";
        }
    }
    usage << "  " << std::left << std::setw(40) << "-h, --help" << "Show this message and exit\n";
    return usage.str();
}
