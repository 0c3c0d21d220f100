#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "common/logger.hpp"
#include "common/operation_status.hpp"

struct VcdConnectionConfig {
    std::string host;
    std::string apiVersion = "31.0";
    std::string token;
    bool bearerToken = false;
    bool verifySsl = true;
};

class VcdRestClient {
public:
    explicit VcdRestClient(const VcdConnectionConfig& config);
    virtual ~VcdRestClient();

    VcdRestClient(const VcdRestClient&) = delete;
    VcdRestClient& operator=(const VcdRestClient&) = delete;

    // `endpoint` is a path below the host or an absolute href returned by the server.
    virtual OperationStatus request(const std::string& method, const std::string& endpoint,
                                    const std::string& contentType, const nlohmann::json& body,
                                    nlohmann::json& response);

    OperationStatus get(const std::string& endpoint, nlohmann::json& response);
    OperationStatus post(const std::string& endpoint, const std::string& contentType,
                         const nlohmann::json& body, nlohmann::json& response);
    OperationStatus put(const std::string& endpoint, const std::string& contentType,
                        const nlohmann::json& body, nlohmann::json& response);
    OperationStatus remove(const std::string& endpoint, nlohmann::json& response);

    // Query service in records format. Reads every page until `total` records are collected.
    OperationStatus queryRecords(const std::string& type, const std::string& filter,
                                 std::vector<nlohmann::json>& records);

    // One `key==value` filter term. The value is percent-escaped so that
    // `,` `;` `*` and `==` inside it never act as filter operators.
    static std::string filterTerm(const std::string& key, const std::string& value);

    std::string buildUrl(const std::string& endpoint) const;
    const std::string& getApiVersion() const { return config_.apiVersion; }
    std::string getLastError() const { return lastError_; }

    static constexpr int kQueryPageSize = 128;

protected:
    void setLastError(const std::string& error) { lastError_ = error; }

private:
    void applyCommonOptions();
    OperationStatus statusFromResponse(const std::string& method, const std::string& url,
                                       long httpCode, const std::string& body);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

    VcdConnectionConfig config_;
    CURL* curl_;
    std::string lastError_;
};
