#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct DhcpSpec {
    bool enabled = false;
    std::optional<int> defaultLeaseSeconds;
    std::optional<int> maxLeaseSeconds;
    std::optional<std::string> rangeStart;
    std::optional<std::string> rangeEnd;
};

struct ExternalNetworkSpec {
    std::string name;
    std::string vimServerName;
    std::vector<std::string> portGroups;
    std::string gatewayIp;
    std::string netmask;
    std::vector<std::string> ipRanges;  // "start-end", input order
    std::string description;
    std::optional<std::string> primaryDns;
    std::optional<std::string> secondaryDns;
    std::optional<std::string> dnsSuffix;
};

struct ExternalNetworkUpdate {
    std::string name;
    std::optional<std::string> newName;
    std::optional<std::string> newDescription;
};

struct DirectNetworkSpec {
    std::string name;
    std::string parentNetworkName;
    std::string description;
    bool isShared = false;
};

struct IsolatedNetworkSpec {
    std::string name;
    std::string gatewayIp;
    std::string netmask;
    std::string description;
    std::optional<std::string> primaryDns;
    std::optional<std::string> secondaryDns;
    std::optional<std::string> dnsSuffix;
    std::optional<std::string> ipRangeStart;
    std::optional<std::string> ipRangeEnd;
    std::optional<DhcpSpec> dhcp;
    bool isShared = false;
};

// Handle to an asynchronous remote operation. Reported, never polled.
struct TaskResult {
    std::string href;
    std::string name;
    std::string operation;
    std::string operationName;
    std::string status;
    nlohmann::json raw;
};

struct NetworkSummary {
    std::string name;
};
