#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/CircuitState.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace apiclient::domain {

/**
 * @brief Переход состояния circuit breaker
 */
struct StateTransition {
    TimePoint timestamp;
    CircuitState from;
    CircuitState to;

    nlohmann::json toJson() const {
        return {
            {"timestamp", Timestamp(timestamp).toString()},
            {"from", toString(from)},
            {"to", toString(to)}
        };
    }
};

/**
 * @brief Снимок метрик circuit breaker для get_status()
 */
struct CircuitBreakerMetrics {
    CircuitState state = CircuitState::CLOSED;
    int consecutiveFailures = 0;
    uint64_t totalFailures = 0;
    uint64_t totalSuccesses = 0;
    double failureRate = 0.0;
    std::optional<StateTransition> lastStateChange;
    size_t stateChanges24h = 0;

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"state", toString(state)},
            {"failures", consecutiveFailures},
            {"total_failures", totalFailures},
            {"total_successes", totalSuccesses},
            {"failure_rate", failureRate},
            {"state_changes_24h", stateChanges24h}
        };
        j["last_state_change"] = lastStateChange ? lastStateChange->toJson() : nlohmann::json();
        return j;
    }
};

} // namespace apiclient::domain
