#include "network/vcd_platform.hpp"
#include "network/task_parser.hpp"
#include "common/logger.hpp"
#include <utility>

const char* const VcdPlatform::kExternalNetworkContentType = "application/vnd.vmware.admin.vmwexternalnet+json";

static const char* const kExternalNetworkReferencesEndpoint = "/api/admin/extension/externalNetworkReferences";
static const char* const kExternalNetworksEndpoint = "/api/admin/extension/externalnets";

bool splitIpRange(const std::string& range, std::string& startAddress, std::string& endAddress) {
    size_t dash = range.find('-');
    if (dash == std::string::npos || dash == 0 || dash == range.size() - 1) {
        return false;
    }
    startAddress = range.substr(0, dash);
    endAddress = range.substr(dash + 1);
    return true;
}

VcdPlatform::VcdPlatform(std::shared_ptr<VcdRestClient> client)
    : client_(std::move(client)) {
}

OperationStatus VcdPlatform::createExternalNetwork(const ExternalNetworkSpec& spec, TaskResult& task) {
    Logger::info("Creating external network: " + spec.name);

    if (spec.portGroups.empty() || spec.ipRanges.empty()) {
        return OperationStatus::failure(ErrorKind::ValidationError,
                                        "At least one port group and one IP range are required");
    }

    nlohmann::json ipRanges = nlohmann::json::array();
    for (const auto& range : spec.ipRanges) {
        std::string startAddress, endAddress;
        if (!splitIpRange(range, startAddress, endAddress)) {
            return OperationStatus::failure(ErrorKind::ValidationError,
                                            "Invalid IP range '" + range + "', expected StartAddress-EndAddress");
        }
        ipRanges.push_back({{"startAddress", startAddress}, {"endAddress", endAddress}});
    }

    std::string vimServerHref;
    OperationStatus status = findVimServerHref(spec.vimServerName, vimServerHref);
    if (!status) {
        return status;
    }

    nlohmann::json portGroupRefs = nlohmann::json::array();
    for (const auto& portGroupName : spec.portGroups) {
        nlohmann::json record;
        status = findPortGroup(portGroupName, spec.vimServerName, record);
        if (!status) {
            return status;
        }
        portGroupRefs.push_back({
            {"vimServerRef", {{"href", vimServerHref}}},
            {"moRef", record.value("moref", "")},
            {"vimObjectType", record.value("portgroupType", "DV_PORTGROUP")}
        });
    }

    nlohmann::json ipScope = {
        {"isInherited", false},
        {"gateway", spec.gatewayIp},
        {"netmask", spec.netmask},
        {"ipRanges", {{"ipRange", ipRanges}}}
    };
    if (spec.primaryDns) {
        ipScope["dns1"] = *spec.primaryDns;
    }
    if (spec.secondaryDns) {
        ipScope["dns2"] = *spec.secondaryDns;
    }
    if (spec.dnsSuffix) {
        ipScope["dnsSuffix"] = *spec.dnsSuffix;
    }

    nlohmann::json payload = {
        {"name", spec.name},
        {"description", spec.description},
        {"configuration", {
            {"ipScopes", {{"ipScope", nlohmann::json::array({ipScope})}}},
            {"fenceMode", "isolated"}
        }},
        {"vimPortGroupRefs", {{"vimObjectRef", portGroupRefs}}}
    };

    nlohmann::json response;
    status = client_->post(kExternalNetworksEndpoint, kExternalNetworkContentType, payload, response);
    if (!status) {
        return status;
    }
    return firstQueuedTask(response, task);
}

OperationStatus VcdPlatform::listExternalNetworks(std::vector<NetworkSummary>& networks) {
    networks.clear();

    nlohmann::json references;
    OperationStatus status = getExternalNetworkReferences(references);
    if (!status) {
        return status;
    }

    for (const auto& reference : references) {
        networks.push_back({reference.value("name", "")});
    }
    return OperationStatus::success();
}

OperationStatus VcdPlatform::deleteExternalNetwork(const std::string& name, TaskResult& task) {
    Logger::info("Deleting external network: " + name);

    std::string href;
    OperationStatus status = findExternalNetworkHref(name, href);
    if (!status) {
        return status;
    }

    nlohmann::json response;
    status = client_->remove(href, response);
    if (!status) {
        return status;
    }
    return taskFromDeleteResponse(response, task);
}

OperationStatus VcdPlatform::updateExternalNetwork(const ExternalNetworkUpdate& update, TaskResult& task) {
    Logger::info("Updating external network: " + update.name);

    std::string href;
    OperationStatus status = findExternalNetworkHref(update.name, href);
    if (!status) {
        return status;
    }

    nlohmann::json network;
    status = client_->get(href, network);
    if (!status) {
        return status;
    }

    // Fields that were not supplied keep their current value
    network["name"] = update.newName ? *update.newName : update.name;
    if (update.newDescription) {
        network["description"] = *update.newDescription;
    }

    nlohmann::json response;
    status = client_->put(href, kExternalNetworkContentType, network, response);
    if (!status) {
        return status;
    }
    return firstQueuedTask(response, task);
}

OperationStatus VcdPlatform::getExternalNetworkReferences(nlohmann::json& references) {
    nlohmann::json response;
    OperationStatus status = client_->get(kExternalNetworkReferencesEndpoint, response);
    if (!status) {
        return status;
    }

    references = nlohmann::json::array();
    if (response.is_object() && response.contains("externalNetworkReference")
        && response["externalNetworkReference"].is_array()) {
        references = response["externalNetworkReference"];
    }
    return OperationStatus::success();
}

OperationStatus VcdPlatform::findExternalNetworkHref(const std::string& name, std::string& href) {
    nlohmann::json references;
    OperationStatus status = getExternalNetworkReferences(references);
    if (!status) {
        return status;
    }

    for (const auto& reference : references) {
        if (reference.value("name", "") == name) {
            href = reference.value("href", "");
            if (href.empty()) {
                return OperationStatus::failure(ErrorKind::RemoteRejected,
                                                "External network '" + name + "' has no href");
            }
            return OperationStatus::success();
        }
    }
    return OperationStatus::failure(ErrorKind::RemoteRejected, "External network '" + name + "' not found");
}

OperationStatus VcdPlatform::findVimServerHref(const std::string& vimServerName, std::string& href) {
    std::vector<nlohmann::json> records;
    OperationStatus status = client_->queryRecords(
        "virtualCenter", VcdRestClient::filterTerm("name", vimServerName), records);
    if (!status) {
        return status;
    }
    const nlohmann::json* record = findRecordByName(records, vimServerName);
    if (!record || record->value("href", "").empty()) {
        return OperationStatus::failure(ErrorKind::RemoteRejected, "vCenter '" + vimServerName + "' not found");
    }
    href = record->value("href", "");
    return OperationStatus::success();
}

OperationStatus VcdPlatform::findPortGroup(const std::string& portGroupName, const std::string& vimServerName,
                                           nlohmann::json& record) {
    std::vector<nlohmann::json> records;
    OperationStatus status = client_->queryRecords(
        "portgroup",
        VcdRestClient::filterTerm("name", portGroupName) + ";" + VcdRestClient::filterTerm("vcName", vimServerName),
        records);
    if (!status) {
        return status;
    }
    const nlohmann::json* match = findRecordByName(records, portGroupName);
    if (!match) {
        return OperationStatus::failure(ErrorKind::RemoteRejected,
                                        "Port group '" + portGroupName + "' not found in vCenter '"
                                        + vimServerName + "'");
    }
    record = *match;
    return OperationStatus::success();
}
