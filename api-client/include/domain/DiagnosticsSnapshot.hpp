#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace apiclient::domain {

struct SlowEndpointSummary {
    size_t count = 0;
    double avgDuration = 0.0;   ///< секунды
};

struct ConnectionIssueSummary {
    size_t count = 0;
    std::optional<std::string> lastError;
};

/**
 * @brief Read-only снимок Diagnostics
 *
 * Копия данных на момент вызова get_diagnostics(), с внутренними
 * структурами Diagnostics не связан.
 */
struct DiagnosticsSnapshot {
    size_t currentIssues = 0;   ///< errors + warnings за последние 24 часа
    size_t totalIssues = 0;     ///< размер кольцевой истории
    std::map<std::string, size_t> bySeverity;
    std::map<std::string, size_t> byCategory;
    std::map<std::string, SlowEndpointSummary> slowEndpoints;
    std::map<std::string, ConnectionIssueSummary> connectionIssues;
    std::map<std::string, size_t> errorPatterns;

    nlohmann::json toJson() const {
        nlohmann::json slow = nlohmann::json::object();
        for (const auto& [endpoint, s] : slowEndpoints) {
            slow[endpoint] = {{"count", s.count}, {"avg_duration", s.avgDuration}};
        }

        nlohmann::json connections = nlohmann::json::object();
        for (const auto& [host, c] : connectionIssues) {
            connections[host] = {
                {"count", c.count},
                {"last_error", c.lastError ? nlohmann::json(*c.lastError) : nlohmann::json()}
            };
        }

        return {
            {"issues", {
                {"current", currentIssues},
                {"total", totalIssues},
                {"by_severity", bySeverity},
                {"by_category", byCategory}
            }},
            {"performance", {{"slow_endpoints", slow}}},
            {"connections", {{"issues", connections}}},
            {"error_patterns", errorPatterns}
        };
    }
};

} // namespace apiclient::domain
