#include "session/session_profile.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string defaultProfilePath() {
    return utils::getEnv("VCDNET_PROFILE", utils::expandHome("~/.vcdnet/profile.json"));
}

bool loadSessionProfile(const std::string& path, SessionProfile& profile, std::string& error) {
    Logger::debug("Loading session profile from: " + path);

    if (!std::filesystem::exists(path)) {
        error = "No session profile found at " + path;
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open session profile: " + path;
        return false;
    }

    json data;
    try {
        file >> data;
    } catch (const json::parse_error& e) {
        error = "Failed to parse session profile " + path + ": " + std::string(e.what());
        return false;
    }

    if (!data.is_object()) {
        error = "Session profile " + path + " is not a JSON object";
        return false;
    }

    try {
        profile.host = data.value("host", "");
        profile.apiVersion = data.value("api_version", profile.apiVersion);
        profile.token = data.value("token", "");
        profile.tokenType = data.value("token_type", profile.tokenType);
        profile.org = data.value("org", "");
        profile.vdc = data.value("vdc", "");
        profile.vdcHref = data.value("vdc_href", "");
        profile.verifySsl = data.value("verify_ssl", true);
    } catch (const json::type_error& e) {
        error = "Invalid value in session profile " + path + ": " + std::string(e.what());
        return false;
    }

    Logger::debug("Session profile loaded for host: " + profile.host + ", org: " + profile.org
                  + ", vdc: " + (profile.vdc.empty() ? "<none>" : profile.vdc));
    return true;
}
