#pragma once

#include "cli/argument_parser.hpp"
#include "cli/confirmer.hpp"
#include "cli/output_sink.hpp"
#include "common/operation_status.hpp"
#include "network/resource_locator.hpp"
#include "session/session_provider.hpp"
#include <string>
#include <vector>

// Everything a handler may touch, passed explicitly.
struct CommandContext {
    SessionProvider& sessions;
    ResourceLocator& locator;
    Confirmer& confirmer;
    OutputSink& output;
};

using CommandHandler = OperationStatus (*)(CommandContext& context, const ParsedArguments& args);

struct CommandSpec {
    std::string group;
    std::string name;
    std::string shortHelp;
    std::vector<ArgumentSpec> arguments;
    std::vector<OptionSpec> options;
    CommandHandler handler;
};

struct CommandGroup {
    std::string name;
    std::string shortHelp;
    std::string help;
};

// Root of the table: vcdnet network <group> <command>
extern const char* const kRootCommand;
extern const char* const kRootShortHelp;

const std::vector<CommandGroup>& commandGroups();
const std::vector<CommandSpec>& commandTable();

const CommandGroup* findCommandGroup(const std::string& group);
const CommandSpec* findCommand(const std::string& group, const std::string& name);
