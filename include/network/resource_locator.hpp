#pragma once

#include "common/operation_status.hpp"
#include "network/platform_api.hpp"
#include "network/vdc_api.hpp"
#include "session/session_context.hpp"
#include <memory>
#include <string>

// Turns an already restored session into the proxy object a command talks to.
// Resolution never contacts the server.
class ResourceLocator {
public:
    virtual ~ResourceLocator() = default;

    OperationStatus resolvePlatform(const SessionContext& session, std::unique_ptr<PlatformApi>& platform);
    OperationStatus resolveVdc(const SessionContext& session, std::unique_ptr<VdcApi>& vdc);

protected:
    virtual std::unique_ptr<PlatformApi> createPlatform(const SessionContext& session) = 0;
    virtual std::unique_ptr<VdcApi> createVdc(const SessionContext& session, const std::string& vdcHref) = 0;
};

class VcdResourceLocator : public ResourceLocator {
public:
    ~VcdResourceLocator() override = default;

protected:
    std::unique_ptr<PlatformApi> createPlatform(const SessionContext& session) override;
    std::unique_ptr<VdcApi> createVdc(const SessionContext& session, const std::string& vdcHref) override;
};
