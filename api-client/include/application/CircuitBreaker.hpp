#pragma once

#include "domain/CircuitBreakerMetrics.hpp"
#include "domain/enums/CircuitState.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ApiClientConfig.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apiclient::application {

/**
 * @brief Circuit breaker одного upstream
 *
 * CLOSED -> OPEN после failureThreshold неудач подряд.
 * OPEN -> HALF_OPEN при первом allowRequest() после recoveryTimeout.
 * HALF_OPEN -> CLOSED после halfOpenLimit успехов подряд,
 * HALF_OPEN -> OPEN после любой неудачи.
 *
 * Каждый переход выполняется под мьютексом и пишется в историю
 * (не больше historyLimit записей).
 */
class CircuitBreaker {
public:
    CircuitBreaker(
        std::string name,
        settings::CircuitBreakerConfig config,
        std::shared_ptr<ports::output::IClock> clock
    );

    bool allowRequest();

    void recordSuccess();

    void recordFailure();

    domain::CircuitState state() const;

    domain::CircuitBreakerMetrics metrics() const;

    std::vector<domain::StateTransition> history() const;

    const std::string& name() const { return name_; }

private:
    // Вызывается только под mutex_
    void changeState(domain::CircuitState newState);

    std::string name_;
    settings::CircuitBreakerConfig config_;
    std::shared_ptr<ports::output::IClock> clock_;

    mutable std::mutex mutex_;
    domain::CircuitState state_ = domain::CircuitState::CLOSED;
    int consecutiveFailures_ = 0;
    int halfOpenSuccesses_ = 0;
    domain::TimePoint lastFailureTime_{};
    uint64_t totalFailures_ = 0;
    uint64_t totalSuccesses_ = 0;
    std::deque<domain::StateTransition> history_;
};

} // namespace apiclient::application
