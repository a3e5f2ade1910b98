#pragma once

#include "ports/input/IApiClient.hpp"
#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>

namespace apiclient::adapters::primary {

/**
 * @brief HTTP Handler со снимком состояния клиента
 *
 * Endpoint: GET /api/v1/status
 */
class StatusHandler : public IHttpHandler
{
public:
    explicit StatusHandler(std::shared_ptr<ports::input::IApiClient> client)
        : client_(std::move(client))
    {
        std::cout << "[StatusHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        try {
            res.setResult(200, "application/json", client_->getStatus().toJson().dump());
        } catch (const std::exception& e) {
            std::cerr << "[StatusHandler] Error: " << e.what() << std::endl;
            nlohmann::json error = {{"error", "status unavailable"}, {"message", e.what()}};
            res.setResult(500, "application/json", error.dump());
        }
    }

private:
    std::shared_ptr<ports::input::IApiClient> client_;
};

} // namespace apiclient::adapters::primary
