#pragma once

#include "common/operation_status.hpp"
#include "common/vcd_types.hpp"
#include <string>
#include <vector>

// Org VDC network operations, scoped to one virtual datacenter.
class VdcApi {
public:
    virtual ~VdcApi() = default;

    virtual OperationStatus createDirectNetwork(const DirectNetworkSpec& spec, TaskResult& task) = 0;
    virtual OperationStatus listDirectNetworks(std::vector<NetworkSummary>& networks) = 0;
    virtual OperationStatus deleteDirectNetwork(const std::string& name, bool force, TaskResult& task) = 0;

    virtual OperationStatus createIsolatedNetwork(const IsolatedNetworkSpec& spec, TaskResult& task) = 0;
    virtual OperationStatus listIsolatedNetworks(std::vector<NetworkSummary>& networks) = 0;
    virtual OperationStatus deleteIsolatedNetwork(const std::string& name, bool force, TaskResult& task) = 0;
};
