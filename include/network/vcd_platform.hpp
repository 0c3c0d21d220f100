#pragma once

#include "network/platform_api.hpp"
#include "common/vcd_rest_client.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// PlatformApi over the vCloud admin extension API.
class VcdPlatform : public PlatformApi {
public:
    explicit VcdPlatform(std::shared_ptr<VcdRestClient> client);
    ~VcdPlatform() override = default;

    OperationStatus createExternalNetwork(const ExternalNetworkSpec& spec, TaskResult& task) override;
    OperationStatus listExternalNetworks(std::vector<NetworkSummary>& networks) override;
    OperationStatus deleteExternalNetwork(const std::string& name, TaskResult& task) override;
    OperationStatus updateExternalNetwork(const ExternalNetworkUpdate& update, TaskResult& task) override;

    static const char* const kExternalNetworkContentType;

private:
    OperationStatus getExternalNetworkReferences(nlohmann::json& references);
    OperationStatus findExternalNetworkHref(const std::string& name, std::string& href);
    OperationStatus findVimServerHref(const std::string& vimServerName, std::string& href);
    OperationStatus findPortGroup(const std::string& portGroupName, const std::string& vimServerName,
                                  nlohmann::json& record);

    std::shared_ptr<VcdRestClient> client_;
};

// Splits "start-end" into its two addresses.
bool splitIpRange(const std::string& range, std::string& startAddress, std::string& endAddress);
