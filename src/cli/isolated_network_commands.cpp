#include "cli/network_commands.hpp"
#include <optional>
#include <memory>

static OperationStatus optionalInteger(const ParsedArguments& args, const std::string& option,
                                       std::optional<int>& value) {
    if (!args.hasValue(option)) {
        value.reset();
        return OperationStatus::success();
    }
    int parsed = 0;
    OperationStatus status = parseIntegerOption(option, args.value(option), parsed);
    if (!status) {
        return status;
    }
    value = parsed;
    return OperationStatus::success();
}

// A DHCP block is sent as soon as any DHCP setting is on the command line.
static OperationStatus readDhcpSpec(const ParsedArguments& args, std::optional<DhcpSpec>& dhcp) {
    std::optional<bool> enabled = args.toggle("--dhcp-enabled");
    bool anyDhcpOption = args.hasValue("--default-lease-time") || args.hasValue("--max-lease-time")
                         || args.hasValue("--dhcp-ip-range-start") || args.hasValue("--dhcp-ip-range-end");
    if (!enabled && !anyDhcpOption) {
        dhcp.reset();
        return OperationStatus::success();
    }

    DhcpSpec spec;
    spec.enabled = enabled.value_or(false);
    OperationStatus status = optionalInteger(args, "--default-lease-time", spec.defaultLeaseSeconds);
    if (!status) {
        return status;
    }
    status = optionalInteger(args, "--max-lease-time", spec.maxLeaseSeconds);
    if (!status) {
        return status;
    }
    spec.rangeStart = args.optionalValue("--dhcp-ip-range-start");
    spec.rangeEnd = args.optionalValue("--dhcp-ip-range-end");
    dhcp = spec;
    return OperationStatus::success();
}

OperationStatus createIsolatedNetworkCommand(CommandContext& context, const ParsedArguments& args) {
    IsolatedNetworkSpec spec;
    spec.name = args.argument("name");
    spec.gatewayIp = args.value("--gateway");
    spec.netmask = args.value("--netmask");
    spec.description = args.value("--description");
    spec.primaryDns = args.optionalValue("--dns1");
    spec.secondaryDns = args.optionalValue("--dns2");
    spec.dnsSuffix = args.optionalValue("--dns-suffix");
    spec.ipRangeStart = args.optionalValue("--ip-range-start");
    spec.ipRangeEnd = args.optionalValue("--ip-range-end");
    spec.isShared = args.flag("--shared");

    OperationStatus status = readDhcpSpec(args, spec.dhcp);
    if (!status) {
        return status;
    }

    std::unique_ptr<VdcApi> vdc;
    status = resolveSelectedVdc(context, vdc);
    if (!status) {
        return status;
    }

    TaskResult task;
    status = vdc->createIsolatedNetwork(spec, task);
    if (!status) {
        return status;
    }

    context.output.printTask(task);
    return OperationStatus::success();
}

OperationStatus listIsolatedNetworksCommand(CommandContext& context, const ParsedArguments&) {
    std::unique_ptr<VdcApi> vdc;
    OperationStatus status = resolveSelectedVdc(context, vdc);
    if (!status) {
        return status;
    }

    std::vector<NetworkSummary> networks;
    status = vdc->listIsolatedNetworks(networks);
    if (!status) {
        return status;
    }

    context.output.printNetworks(networks);
    return OperationStatus::success();
}

OperationStatus deleteIsolatedNetworkCommand(CommandContext& context, const ParsedArguments& args) {
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
    status = vdc->deleteIsolatedNetwork(name, force, task);
    if (!status) {
        return status;
    }

    context.output.printTask(task);
    return OperationStatus::success();
}
