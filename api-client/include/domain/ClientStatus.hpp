#pragma once

#include "domain/CircuitBreakerMetrics.hpp"
#include "domain/DiagnosticsSnapshot.hpp"
#include "domain/Metric.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <string>

namespace apiclient::domain {

struct ConnectionStats {
    size_t active = 0;      ///< созданные и ещё живые сессии
    size_t available = 0;   ///< готовые к выдаче
    size_t maxSize = 0;
};

/**
 * @brief Результат get_status()
 */
struct ClientStatus {
    std::map<std::string, bool> health;
    std::map<std::string, MetricStats> metrics;
    DiagnosticsSnapshot diagnostics;
    std::map<std::string, CircuitBreakerMetrics> circuitBreakers;
    std::map<std::string, ConnectionStats> connections;   ///< по upstream
    size_t localCacheSize = 0;
    size_t rateLimiterKeys = 0;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["health"] = health;

        j["metrics"] = nlohmann::json::object();
        for (const auto& [name, stats] : metrics) {
            j["metrics"][name] = stats.toJson();
        }

        j["diagnostics"] = diagnostics.toJson();

        j["circuit_breakers"] = nlohmann::json::object();
        for (const auto& [name, cb] : circuitBreakers) {
            j["circuit_breakers"][name] = cb.toJson();
        }

        j["connections"] = nlohmann::json::object();
        for (const auto& [name, c] : connections) {
            j["connections"][name] = {
                {"active", c.active},
                {"available", c.available},
                {"max_size", c.maxSize}
            };
        }

        j["cache"] = {{"local_size", localCacheSize}};
        j["rate_limiter"] = {{"tracked_keys", rateLimiterKeys}};
        return j;
    }
};

} // namespace apiclient::domain
