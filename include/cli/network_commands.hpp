#pragma once

#include "cli/command_table.hpp"
#include <memory>

extern const char* const kDeleteOrgVdcNetworkPrompt;
extern const char* const kDeleteExternalNetworkPrompt;

// Session restore followed by resource resolution. The VDC variant requires a
// selected VDC and fails with NoVdcSelected before any remote call.
OperationStatus resolveSystemPlatform(CommandContext& context, std::unique_ptr<PlatformApi>& platform);
OperationStatus resolveSelectedVdc(CommandContext& context, std::unique_ptr<VdcApi>& vdc);

// network external
OperationStatus createExternalNetworkCommand(CommandContext& context, const ParsedArguments& args);
OperationStatus listExternalNetworksCommand(CommandContext& context, const ParsedArguments& args);
OperationStatus deleteExternalNetworkCommand(CommandContext& context, const ParsedArguments& args);
OperationStatus updateExternalNetworkCommand(CommandContext& context, const ParsedArguments& args);

// network direct
OperationStatus createDirectNetworkCommand(CommandContext& context, const ParsedArguments& args);
OperationStatus listDirectNetworksCommand(CommandContext& context, const ParsedArguments& args);
OperationStatus deleteDirectNetworkCommand(CommandContext& context, const ParsedArguments& args);

// network isolated
OperationStatus createIsolatedNetworkCommand(CommandContext& context, const ParsedArguments& args);
OperationStatus listIsolatedNetworksCommand(CommandContext& context, const ParsedArguments& args);
OperationStatus deleteIsolatedNetworkCommand(CommandContext& context, const ParsedArguments& args);
