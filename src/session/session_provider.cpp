#include "session/session_provider.hpp"
#include "session/session_profile.hpp"
#include "common/logger.hpp"
#include <stdexcept>

ProfileSessionProvider::ProfileSessionProvider(const std::string& profilePath)
    : profilePath_(profilePath) {
}

OperationStatus ProfileSessionProvider::restoreSession(bool requireVdcSelected, SessionContext& session) {
    SessionProfile profile;
    std::string error;
    if (!loadSessionProfile(profilePath_, profile, error)) {
        Logger::error(error);
        return OperationStatus::failure(ErrorKind::AuthFailure, "Not logged in: " + error);
    }

    if (profile.host.empty() || profile.token.empty()) {
        Logger::error("Session profile has no host or token: " + profilePath_);
        return OperationStatus::failure(ErrorKind::AuthFailure, "Not logged in: session profile has no active session");
    }

    if (requireVdcSelected && profile.vdcHref.empty()) {
        return OperationStatus::failure(ErrorKind::NoVdcSelected, "No virtual datacenter is selected");
    }

    VcdConnectionConfig config;
    config.host = profile.host;
    config.apiVersion = profile.apiVersion;
    config.token = profile.token;
    config.bearerToken = profile.tokenType == "bearer";
    config.verifySsl = profile.verifySsl;

    try {
        session.client = createClient(config);
    } catch (const std::runtime_error& e) {
        Logger::error("Failed to create REST client: " + std::string(e.what()));
        return OperationStatus::failure(ErrorKind::ConnectionFailure, e.what());
    }

    session.host = profile.host;
    session.orgName = profile.org;
    session.selectedVdcName = profile.vdc;
    if (!profile.vdcHref.empty()) {
        session.selectedVdcHref = profile.vdcHref;
    } else {
        session.selectedVdcHref.reset();
    }

    Logger::debug("Session restored for org " + profile.org + " on " + profile.host);
    return OperationStatus::success();
}

std::shared_ptr<VcdRestClient> ProfileSessionProvider::createClient(const VcdConnectionConfig& config) {
    return std::make_shared<VcdRestClient>(config);
}
