#include "cli/network_commands.hpp"

const char* const kDeleteOrgVdcNetworkPrompt = "Are you sure you want to delete the OrgVdc Network?";
const char* const kDeleteExternalNetworkPrompt = "Are you sure you want to delete the external network?";

OperationStatus resolveSystemPlatform(CommandContext& context, std::unique_ptr<PlatformApi>& platform) {
    SessionContext session;
    OperationStatus status = context.sessions.restoreSession(false, session);
    if (!status) {
        return status;
    }
    return context.locator.resolvePlatform(session, platform);
}

OperationStatus resolveSelectedVdc(CommandContext& context, std::unique_ptr<VdcApi>& vdc) {
    SessionContext session;
    OperationStatus status = context.sessions.restoreSession(true, session);
    if (!status) {
        return status;
    }
    return context.locator.resolveVdc(session, vdc);
}
