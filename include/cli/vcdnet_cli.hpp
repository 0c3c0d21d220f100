#pragma once

#include "cli/command_table.hpp"
#include <string>
#include <vector>

class VcdnetCli {
public:
    explicit VcdnetCli(CommandContext context);

    // `args` starts at the command path, global options already removed.
    int run(const std::vector<std::string>& args);

    void printUsage() const;

    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

private:
    int runCommand(const CommandSpec& command, const std::vector<std::string>& args);
    int usageError(const std::string& message, const std::string& usage);
    int finish(const std::string& path, const OperationStatus& status);

    std::string rootUsage() const;
    std::string groupUsage(const CommandGroup& group) const;
    std::string commandUsage(const CommandSpec& command) const;

    CommandContext context_;
};

std::string globalUsage();
