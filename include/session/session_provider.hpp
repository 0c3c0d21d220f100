#pragma once

#include "common/operation_status.hpp"
#include "common/vcd_rest_client.hpp"
#include "session/session_context.hpp"
#include <memory>
#include <string>

class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    // Rebuilds the session of the current invocation. Fails with AuthFailure
    // when there is no usable session and with NoVdcSelected when a VDC is
    // required but none is selected.
    virtual OperationStatus restoreSession(bool requireVdcSelected, SessionContext& session) = 0;
};

class ProfileSessionProvider : public SessionProvider {
public:
    explicit ProfileSessionProvider(const std::string& profilePath);
    ~ProfileSessionProvider() override = default;

    OperationStatus restoreSession(bool requireVdcSelected, SessionContext& session) override;

protected:
    virtual std::shared_ptr<VcdRestClient> createClient(const VcdConnectionConfig& config);

private:
    std::string profilePath_;
};
