#include "common/vcd_rest_client.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <sstream>

VcdRestClient::VcdRestClient(const VcdConnectionConfig& config)
    : config_(config), curl_(nullptr) {
    Logger::debug("Initializing VcdRestClient for host: " + config_.host);

    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();
    if (!curl_) {
        Logger::error("Failed to initialize CURL");
        throw std::runtime_error("Failed to initialize CURL");
    }

    if (!config_.verifySsl) {
        Logger::warning("SSL verification is disabled for host: " + config_.host);
    }
}

VcdRestClient::~VcdRestClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    curl_global_cleanup();
}

void VcdRestClient::applyCommonOptions() {
    curl_easy_reset(curl_);

    long verify = config_.verifySsl ? 1L : 0L;
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, verify);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, config_.verifySsl ? 2L : 0L);

    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 30L);  // 30 seconds connection timeout
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, 300L);        // 5 minutes operation timeout
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
}

std::string VcdRestClient::buildUrl(const std::string& endpoint) const {
    if (utils::startsWith(endpoint, "https://") || utils::startsWith(endpoint, "http://")) {
        return endpoint;
    }
    if (utils::startsWith(config_.host, "https://") || utils::startsWith(config_.host, "http://")) {
        return config_.host + endpoint;
    }
    return "https://" + config_.host + endpoint;
}

OperationStatus VcdRestClient::request(const std::string& method, const std::string& endpoint,
                                       const std::string& contentType, const nlohmann::json& body,
                                       nlohmann::json& response) {
    if (!curl_) {
        lastError_ = "CURL not initialized";
        Logger::error(lastError_);
        return OperationStatus::failure(ErrorKind::ConnectionFailure, lastError_);
    }

    applyCommonOptions();

    std::string url = buildUrl(endpoint);
    Logger::debug("Making " + method + " request to: " + url);

    struct curl_slist* headers = nullptr;
    std::string acceptHeader = "Accept: application/*+json;version=" + config_.apiVersion;
    headers = curl_slist_append(headers, acceptHeader.c_str());
    if (!contentType.empty()) {
        std::string contentTypeHeader = "Content-Type: " + contentType;
        headers = curl_slist_append(headers, contentTypeHeader.c_str());
    }

    // The token itself never reaches the log
    std::string authHeader = config_.bearerToken
        ? "Authorization: Bearer " + config_.token
        : "x-vcloud-authorization: " + config_.token;
    headers = curl_slist_append(headers, authHeader.c_str());

    std::string payload;
    std::string responseData;
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &responseData);

    if (method == "POST" || method == "PUT") {
        payload = body.is_null() ? std::string() : body.dump();
        Logger::debug("Request body: " + payload);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    }

    CURLcode res = curl_easy_perform(curl_);
    long httpCode = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        lastError_ = "Failed to reach " + url + ": " + std::string(curl_easy_strerror(res));
        Logger::error(lastError_);
        return OperationStatus::failure(ErrorKind::ConnectionFailure, lastError_);
    }

    Logger::debug("Response code: " + std::to_string(httpCode));
    Logger::debug("Response body: " + responseData);

    if (httpCode < 200 || httpCode >= 300) {
        return statusFromResponse(method, url, httpCode, responseData);
    }

    if (responseData.empty()) {
        response = nlohmann::json();
        return OperationStatus::success();
    }

    try {
        response = nlohmann::json::parse(responseData);
    } catch (const nlohmann::json::parse_error& e) {
        lastError_ = "Failed to parse response from " + url + ": " + std::string(e.what());
        Logger::error(lastError_);
        return OperationStatus::failure(ErrorKind::RemoteRejected, lastError_, httpCode);
    }
    return OperationStatus::success();
}

OperationStatus VcdRestClient::statusFromResponse(const std::string& method, const std::string& url,
                                                  long httpCode, const std::string& body) {
    std::string serverMessage;
    try {
        nlohmann::json error = nlohmann::json::parse(body);
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            serverMessage = error["message"].get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) {
        // Non-JSON error pages fall back to the status code
    }

    lastError_ = serverMessage.empty()
        ? "Request failed with status code: " + std::to_string(httpCode)
        : serverMessage;
    Logger::error(method + " " + url + " failed with status code " + std::to_string(httpCode) + ": " + lastError_);

    if (httpCode == 401 || httpCode == 403) {
        return OperationStatus::failure(ErrorKind::AuthFailure, lastError_, httpCode);
    }
    return OperationStatus::failure(ErrorKind::RemoteRejected, lastError_, httpCode);
}

OperationStatus VcdRestClient::get(const std::string& endpoint, nlohmann::json& response) {
    return request("GET", endpoint, "", nlohmann::json(), response);
}

OperationStatus VcdRestClient::post(const std::string& endpoint, const std::string& contentType,
                                    const nlohmann::json& body, nlohmann::json& response) {
    return request("POST", endpoint, contentType, body, response);
}

OperationStatus VcdRestClient::put(const std::string& endpoint, const std::string& contentType,
                                   const nlohmann::json& body, nlohmann::json& response) {
    return request("PUT", endpoint, contentType, body, response);
}

OperationStatus VcdRestClient::remove(const std::string& endpoint, nlohmann::json& response) {
    return request("DELETE", endpoint, "", nlohmann::json(), response);
}

OperationStatus VcdRestClient::queryRecords(const std::string& type, const std::string& filter,
                                            std::vector<nlohmann::json>& records) {
    records.clear();

    for (int page = 1;; ++page) {
        std::ostringstream endpoint;
        endpoint << "/api/query?type=" << type
                 << "&format=records&page=" << page
                 << "&pageSize=" << kQueryPageSize;
        if (!filter.empty()) {
            endpoint << "&filter=" << utils::urlEncode(filter);
        }

        nlohmann::json response;
        OperationStatus status = get(endpoint.str(), response);
        if (!status) {
            return status;
        }

        if (!response.is_object() || !response.contains("record") || !response["record"].is_array()
            || response["record"].empty()) {
            break;
        }
        for (const auto& record : response["record"]) {
            records.push_back(record);
        }

        size_t total = response.value("total", static_cast<size_t>(0));
        if (records.size() >= total) {
            break;
        }
    }

    Logger::debug("Query " + type + " returned " + std::to_string(records.size()) + " record(s)");
    return OperationStatus::success();
}

std::string VcdRestClient::filterTerm(const std::string& key, const std::string& value) {
    return key + "==" + utils::urlEncode(value);
}

size_t VcdRestClient::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}
