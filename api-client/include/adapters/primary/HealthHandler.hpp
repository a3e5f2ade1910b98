#pragma once

#include "ports/input/IApiClient.hpp"
#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <map>
#include <memory>

namespace apiclient::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья
 *
 * Endpoint: GET /health
 *
 * 200 {"status":"ok"} если все зависимости здоровы,
 * иначе 503 {"status":"degraded"} со списком сервисов.
 * Метрики не собираются, только health checks.
 */
class HealthHandler : public IHttpHandler
{
public:
    explicit HealthHandler(std::shared_ptr<ports::input::IApiClient> client)
        : client_(std::move(client))
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        std::map<std::string, bool> health;
        try {
            health = client_->checkHealth();
        } catch (const std::exception& e) {
            std::cerr << "[HealthHandler] Error: " << e.what() << std::endl;
            nlohmann::json error = {{"status", "unavailable"}, {"message", e.what()}};
            res.setResult(503, "application/json", error.dump());
            return;
        }

        bool healthy = true;
        nlohmann::json services = nlohmann::json::object();
        for (const auto& [name, ok] : health) {
            services[name] = ok ? "ready" : "unavailable";
            healthy = healthy && ok;
        }

        nlohmann::json response;
        response["status"] = healthy ? "ok" : "degraded";
        response["services"] = services;

        res.setResult(healthy ? 200 : 503, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::IApiClient> client_;
};

} // namespace apiclient::adapters::primary
