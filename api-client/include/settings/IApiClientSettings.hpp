#pragma once

#include "settings/ApiClientConfig.hpp"

namespace apiclient::settings {

class IApiClientSettings {
public:
    virtual ~IApiClientSettings() = default;

    virtual ApiClientConfig getConfig() const = 0;
};

} // namespace apiclient::settings
