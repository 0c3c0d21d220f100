#include "network/resource_locator.hpp"
#include "network/vcd_platform.hpp"
#include "network/vcd_vdc.hpp"
#include "common/logger.hpp"

OperationStatus ResourceLocator::resolvePlatform(const SessionContext& session,
                                                 std::unique_ptr<PlatformApi>& platform) {
    platform = createPlatform(session);
    if (!platform) {
        return OperationStatus::failure(ErrorKind::AuthFailure, "Session has no authenticated client");
    }
    return OperationStatus::success();
}

OperationStatus ResourceLocator::resolveVdc(const SessionContext& session, std::unique_ptr<VdcApi>& vdc) {
    if (!session.selectedVdcHref || session.selectedVdcHref->empty()) {
        Logger::error("VDC-scoped operation requested without a selected VDC");
        return OperationStatus::failure(ErrorKind::NoVdcSelected, "No virtual datacenter is selected");
    }

    vdc = createVdc(session, *session.selectedVdcHref);
    if (!vdc) {
        return OperationStatus::failure(ErrorKind::AuthFailure, "Session has no authenticated client");
    }
    Logger::debug("Resolved VDC: " + *session.selectedVdcHref);
    return OperationStatus::success();
}

std::unique_ptr<PlatformApi> VcdResourceLocator::createPlatform(const SessionContext& session) {
    if (!session.client) {
        return nullptr;
    }
    return std::make_unique<VcdPlatform>(session.client);
}

std::unique_ptr<VdcApi> VcdResourceLocator::createVdc(const SessionContext& session, const std::string& vdcHref) {
    if (!session.client) {
        return nullptr;
    }
    return std::make_unique<VcdVdc>(session.client, vdcHref);
}
