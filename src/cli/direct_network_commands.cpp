#include "cli/network_commands.hpp"
#include <memory>

OperationStatus createDirectNetworkCommand(CommandContext& context, const ParsedArguments& args) {
    DirectNetworkSpec spec;
    spec.name = args.argument("name");
    spec.parentNetworkName = args.value("--parent");
    spec.description = args.value("--description");
    spec.isShared = args.flag("--shared");

    std::unique_ptr<VdcApi> vdc;
    OperationStatus status = resolveSelectedVdc(context, vdc);
    if (!status) {
        return status;
    }

    TaskResult task;
    status = vdc->createDirectNetwork(spec, task);
    if (!status) {
        return status;
    }

    context.output.printTask(task);
    return OperationStatus::success();
}

OperationStatus listDirectNetworksCommand(CommandContext& context, const ParsedArguments&) {
    std::unique_ptr<VdcApi> vdc;
    OperationStatus status = resolveSelectedVdc(context, vdc);
    if (!status) {
        return status;
    }

    std::vector<NetworkSummary> networks;
    status = vdc->listDirectNetworks(networks);
    if (!status) {
        return status;
    }

    context.output.printNetworks(networks);
    return OperationStatus::success();
}

OperationStatus deleteDirectNetworkCommand(CommandContext& context, const ParsedArguments& args) {
    std::string name = args.argument("name");
    bool force = args.flag("--force");

    std::unique_ptr<VdcApi> vdc;
    OperationStatus status = resolveSelectedVdc(context, vdc);
    if (!status) {
        return status;
    }

    if (!confirmUnlessOverridden(context.confirmer, force || args.flag("--yes"), kDeleteOrgVdcNetworkPrompt)) {
        context.output.printMessage("Aborted.");
        return OperationStatus::success();
    }

    TaskResult task;
    status = vdc->deleteDirectNetwork(name, force, task);
    if (!status) {
        return status;
    }

    context.output.printTask(task);
    return OperationStatus::success();
}
