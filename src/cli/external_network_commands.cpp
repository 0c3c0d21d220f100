#include "cli/network_commands.hpp"
#include "common/logger.hpp"
#include <memory>

OperationStatus createExternalNetworkCommand(CommandContext& context, const ParsedArguments& args) {
    ExternalNetworkSpec spec;
    spec.name = args.argument("name");
    spec.vimServerName = args.argument("vc-name");
    spec.portGroups = args.values("--port-group");
    spec.gatewayIp = args.value("--gateway");
    spec.netmask = args.value("--netmask");
    spec.ipRanges = args.values("--ip-range");
    spec.description = args.value("--description");
    spec.primaryDns = args.optionalValue("--dns1");
    spec.secondaryDns = args.optionalValue("--dns2");
    spec.dnsSuffix = args.optionalValue("--dns-suffix");

    if (spec.portGroups.empty()) {
        return OperationStatus::failure(ErrorKind::ValidationError, "At least one --port-group is required");
    }
    if (spec.ipRanges.empty()) {
        return OperationStatus::failure(ErrorKind::ValidationError, "At least one --ip-range is required");
    }

    std::unique_ptr<PlatformApi> platform;
    OperationStatus status = resolveSystemPlatform(context, platform);
    if (!status) {
        return status;
    }

    TaskResult task;
    status = platform->createExternalNetwork(spec, task);
    if (!status) {
        return status;
    }

    context.output.printTask(task);
    context.output.printMessage("External network created successfully.");
    return OperationStatus::success();
}

OperationStatus listExternalNetworksCommand(CommandContext& context, const ParsedArguments&) {
    std::unique_ptr<PlatformApi> platform;
    OperationStatus status = resolveSystemPlatform(context, platform);
    if (!status) {
        return status;
    }

    std::vector<NetworkSummary> networks;
    status = platform->listExternalNetworks(networks);
    if (!status) {
        return status;
    }

    context.output.printNetworks(networks);
    return OperationStatus::success();
}

OperationStatus deleteExternalNetworkCommand(CommandContext& context, const ParsedArguments& args) {
    std::string name = args.argument("name");

    std::unique_ptr<PlatformApi> platform;
    OperationStatus status = resolveSystemPlatform(context, platform);
    if (!status) {
        return status;
    }

    if (!confirmUnlessOverridden(context.confirmer, args.flag("--yes"), kDeleteExternalNetworkPrompt)) {
        context.output.printMessage("Aborted.");
        return OperationStatus::success();
    }

    TaskResult task;
    status = platform->deleteExternalNetwork(name, task);
    if (!status) {
        return status;
    }

    context.output.printTask(task);
    context.output.printMessage("External network deleted successfully.");
    return OperationStatus::success();
}

OperationStatus updateExternalNetworkCommand(CommandContext& context, const ParsedArguments& args) {
    ExternalNetworkUpdate update;
    update.name = args.argument("name");
    update.newName = args.optionalValue("--name");
    update.newDescription = args.optionalValue("--description");

    if (!update.newName && !update.newDescription) {
        Logger::info("Update of external network " + update.name + " carries no changes");
    }

    std::unique_ptr<PlatformApi> platform;
    OperationStatus status = resolveSystemPlatform(context, platform);
    if (!status) {
        return status;
    }

    TaskResult task;
    status = platform->updateExternalNetwork(update, task);
    if (!status) {
        return status;
    }

    context.output.printTask(task);
    context.output.printMessage("External network updated successfully.");
    return OperationStatus::success();
}
