#include "network/vcd_vdc.hpp"
#include "network/task_parser.hpp"
#include "common/logger.hpp"
#include <utility>

const char* const VcdVdc::kOrgVdcNetworkContentType = "application/vnd.vmware.vcloud.orgVdcNetwork+json";

static std::string linkTypeName(int linkType) {
    return linkType == VcdVdc::kLinkTypeDirect ? "direct" : "isolated";
}

VcdVdc::VcdVdc(std::shared_ptr<VcdRestClient> client, const std::string& vdcHref)
    : client_(std::move(client)), vdcHref_(vdcHref) {
}

std::string VcdVdc::toAdminHref(const std::string& href) {
    if (href.find("/api/admin/") != std::string::npos) {
        return href;
    }
    size_t pos = href.find("/api/");
    if (pos == std::string::npos) {
        return href;
    }
    return href.substr(0, pos) + "/api/admin/" + href.substr(pos + 5);
}

OperationStatus VcdVdc::createDirectNetwork(const DirectNetworkSpec& spec, TaskResult& task) {
    Logger::info("Creating direct org vdc network: " + spec.name + " (parent: " + spec.parentNetworkName + ")");

    std::string parentHref;
    OperationStatus status = findExternalNetworkHref(spec.parentNetworkName, parentHref);
    if (!status) {
        return status;
    }

    nlohmann::json payload = {
        {"name", spec.name},
        {"description", spec.description},
        {"configuration", {
            {"parentNetwork", {{"href", parentHref}, {"name", spec.parentNetworkName}}},
            {"fenceMode", "bridged"}
        }},
        {"isShared", spec.isShared}
    };
    return createNetwork(payload, task);
}

OperationStatus VcdVdc::createIsolatedNetwork(const IsolatedNetworkSpec& spec, TaskResult& task) {
    Logger::info("Creating isolated org vdc network: " + spec.name);

    nlohmann::json ipScope = {
        {"isInherited", false},
        {"gateway", spec.gatewayIp},
        {"netmask", spec.netmask}
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
    if (spec.ipRangeStart || spec.ipRangeEnd) {
        nlohmann::json range = nlohmann::json::object();
        if (spec.ipRangeStart) {
            range["startAddress"] = *spec.ipRangeStart;
        }
        if (spec.ipRangeEnd) {
            range["endAddress"] = *spec.ipRangeEnd;
        }
        ipScope["ipRanges"] = {{"ipRange", nlohmann::json::array({range})}};
    }

    nlohmann::json configuration = {
        {"ipScopes", {{"ipScope", nlohmann::json::array({ipScope})}}},
        {"fenceMode", "isolated"}
    };

    // Lease times and the pool range are checked against the subnet by the server
    if (spec.dhcp) {
        const DhcpSpec& dhcp = *spec.dhcp;
        nlohmann::json dhcpService = {
            {"_type", "DhcpServiceType"},
            {"isEnabled", dhcp.enabled}
        };
        if (dhcp.defaultLeaseSeconds) {
            dhcpService["defaultLeaseTime"] = *dhcp.defaultLeaseSeconds;
        }
        if (dhcp.maxLeaseSeconds) {
            dhcpService["maxLeaseTime"] = *dhcp.maxLeaseSeconds;
        }
        if (dhcp.rangeStart || dhcp.rangeEnd) {
            nlohmann::json range = nlohmann::json::object();
            if (dhcp.rangeStart) {
                range["startAddress"] = *dhcp.rangeStart;
            }
            if (dhcp.rangeEnd) {
                range["endAddress"] = *dhcp.rangeEnd;
            }
            dhcpService["ipRange"] = range;
        }
        configuration["features"] = {{"networkService", nlohmann::json::array({dhcpService})}};
    }

    nlohmann::json payload = {
        {"name", spec.name},
        {"description", spec.description},
        {"configuration", configuration},
        {"isShared", spec.isShared}
    };
    return createNetwork(payload, task);
}

OperationStatus VcdVdc::listDirectNetworks(std::vector<NetworkSummary>& networks) {
    return listNetworks(kLinkTypeDirect, networks);
}

OperationStatus VcdVdc::listIsolatedNetworks(std::vector<NetworkSummary>& networks) {
    return listNetworks(kLinkTypeIsolated, networks);
}

OperationStatus VcdVdc::deleteDirectNetwork(const std::string& name, bool force, TaskResult& task) {
    return deleteNetwork(name, kLinkTypeDirect, force, task);
}

OperationStatus VcdVdc::deleteIsolatedNetwork(const std::string& name, bool force, TaskResult& task) {
    return deleteNetwork(name, kLinkTypeIsolated, force, task);
}

OperationStatus VcdVdc::createNetwork(const nlohmann::json& payload, TaskResult& task) {
    nlohmann::json response;
    OperationStatus status = client_->post(toAdminHref(vdcHref_) + "/networks",
                                           kOrgVdcNetworkContentType, payload, response);
    if (!status) {
        return status;
    }
    return firstQueuedTask(response, task);
}

OperationStatus VcdVdc::listNetworks(int linkType, std::vector<NetworkSummary>& networks) {
    networks.clear();

    std::vector<nlohmann::json> records;
    OperationStatus status = client_->queryRecords(
        "orgVdcNetwork",
        VcdRestClient::filterTerm("vdc", vdcHref_) + ";"
        + VcdRestClient::filterTerm("linkType", std::to_string(linkType)),
        records);
    if (!status) {
        return status;
    }

    for (const auto& record : records) {
        networks.push_back({record.value("name", "")});
    }
    Logger::debug("Found " + std::to_string(networks.size()) + " " + linkTypeName(linkType) + " network(s)");
    return OperationStatus::success();
}

OperationStatus VcdVdc::findNetworkHref(const std::string& name, int linkType, std::string& href) {
    std::vector<nlohmann::json> records;
    OperationStatus status = client_->queryRecords(
        "orgVdcNetwork",
        VcdRestClient::filterTerm("name", name) + ";" + VcdRestClient::filterTerm("vdc", vdcHref_) + ";"
        + VcdRestClient::filterTerm("linkType", std::to_string(linkType)),
        records);
    if (!status) {
        return status;
    }
    const nlohmann::json* record = findRecordByName(records, name);
    // A record that names another vdc never qualifies, whatever the server matched
    if (!record || record->value("vdc", vdcHref_) != vdcHref_ || record->value("href", "").empty()) {
        return OperationStatus::failure(ErrorKind::RemoteRejected,
                                        "No " + linkTypeName(linkType) + " org vdc network found with name '"
                                        + name + "'");
    }
    href = record->value("href", "");
    return OperationStatus::success();
}

OperationStatus VcdVdc::deleteNetwork(const std::string& name, int linkType, bool force, TaskResult& task) {
    Logger::info("Deleting " + linkTypeName(linkType) + " org vdc network: " + name
                 + (force ? " (forced)" : ""));

    std::string href;
    OperationStatus status = findNetworkHref(name, linkType, href);
    if (!status) {
        return status;
    }

    std::string endpoint = toAdminHref(href);
    if (force) {
        endpoint += "?force=true";
    }

    nlohmann::json response;
    status = client_->remove(endpoint, response);
    if (!status) {
        return status;
    }
    return taskFromDeleteResponse(response, task);
}

OperationStatus VcdVdc::findExternalNetworkHref(const std::string& name, std::string& href) {
    std::vector<nlohmann::json> records;
    OperationStatus status = client_->queryRecords("externalNetwork", VcdRestClient::filterTerm("name", name), records);
    if (!status) {
        return status;
    }
    const nlohmann::json* record = findRecordByName(records, name);
    if (!record || record->value("href", "").empty()) {
        return OperationStatus::failure(ErrorKind::RemoteRejected, "External network '" + name + "' not found");
    }
    href = record->value("href", "");
    return OperationStatus::success();
}
