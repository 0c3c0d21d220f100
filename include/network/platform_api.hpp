#pragma once

#include "common/operation_status.hpp"
#include "common/vcd_types.hpp"
#include <string>
#include <vector>

// System-level network operations. Only system administrators may call these.
class PlatformApi {
public:
    virtual ~PlatformApi() = default;

    virtual OperationStatus createExternalNetwork(const ExternalNetworkSpec& spec, TaskResult& task) = 0;
    virtual OperationStatus listExternalNetworks(std::vector<NetworkSummary>& networks) = 0;
    virtual OperationStatus deleteExternalNetwork(const std::string& name, TaskResult& task) = 0;
    virtual OperationStatus updateExternalNetwork(const ExternalNetworkUpdate& update, TaskResult& task) = 0;
};
