#pragma once

#include <cstdlib>
#include <string>
#include <curl/curl.h>

namespace utils {

inline std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    std::string result(encoded ? encoded : str.c_str());
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

inline std::string getEnv(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

// Expands a leading "~/" against $HOME.
inline std::string expandHome(const std::string& path) {
    if (path.size() < 2 || path.compare(0, 2, "~/") != 0) {
        return path;
    }
    std::string home = getEnv("HOME");
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

inline bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace utils
