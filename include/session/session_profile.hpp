#pragma once

#include <string>

// Cached session written by the login tooling. vcdnet only reads it.
struct SessionProfile {
    std::string host;
    std::string apiVersion = "31.0";
    std::string token;
    std::string tokenType = "session";  // "session" or "bearer"
    std::string org;
    std::string vdc;
    std::string vdcHref;
    bool verifySsl = true;
};

// Reads a JSON session profile. Returns false and fills `error` when the file
// is missing, unreadable or not a JSON object.
bool loadSessionProfile(const std::string& path, SessionProfile& profile, std::string& error);

std::string defaultProfilePath();
