#pragma once

#include "common/vcd_rest_client.hpp"
#include <memory>
#include <optional>
#include <string>

struct SessionContext {
    std::shared_ptr<VcdRestClient> client;
    std::string host;
    std::string orgName;
    std::optional<std::string> selectedVdcHref;
    std::string selectedVdcName;
};
