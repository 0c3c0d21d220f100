#pragma once

#include "network/vdc_api.hpp"
#include "common/vcd_rest_client.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// VdcApi bound to one org VDC.
class VcdVdc : public VdcApi {
public:
    VcdVdc(std::shared_ptr<VcdRestClient> client, const std::string& vdcHref);
    ~VcdVdc() override = default;

    OperationStatus createDirectNetwork(const DirectNetworkSpec& spec, TaskResult& task) override;
    OperationStatus listDirectNetworks(std::vector<NetworkSummary>& networks) override;
    OperationStatus deleteDirectNetwork(const std::string& name, bool force, TaskResult& task) override;

    OperationStatus createIsolatedNetwork(const IsolatedNetworkSpec& spec, TaskResult& task) override;
    OperationStatus listIsolatedNetworks(std::vector<NetworkSummary>& networks) override;
    OperationStatus deleteIsolatedNetwork(const std::string& name, bool force, TaskResult& task) override;

    const std::string& getHref() const { return vdcHref_; }

    // Maps a tenant href (/api/vdc/..., /api/network/...) to its admin form.
    static std::string toAdminHref(const std::string& href);

    // linkType values of orgVdcNetwork query records
    static constexpr int kLinkTypeDirect = 0;
    static constexpr int kLinkTypeIsolated = 2;

    static const char* const kOrgVdcNetworkContentType;

private:
    OperationStatus createNetwork(const nlohmann::json& payload, TaskResult& task);
    OperationStatus listNetworks(int linkType, std::vector<NetworkSummary>& networks);
    OperationStatus findNetworkHref(const std::string& name, int linkType, std::string& href);
    OperationStatus deleteNetwork(const std::string& name, int linkType, bool force, TaskResult& task);
    OperationStatus findExternalNetworkHref(const std::string& name, std::string& href);

    std::shared_ptr<VcdRestClient> client_;
    std::string vdcHref_;
};
