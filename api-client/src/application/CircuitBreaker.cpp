#include "application/CircuitBreaker.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace apiclient::application {

CircuitBreaker::CircuitBreaker(
    std::string name,
    settings::CircuitBreakerConfig config,
    std::shared_ptr<ports::output::IClock> clock
) : name_(std::move(name))
  , config_(config)
  , clock_(std::move(clock))
{}

bool CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(mutex_);

    switch (state_) {
        case domain::CircuitState::CLOSED:
            return true;

        case domain::CircuitState::OPEN:
            if (clock_->now() - lastFailureTime_ >= config_.recoveryTimeout) {
                changeState(domain::CircuitState::HALF_OPEN);
                return true;
            }
            return false;

        case domain::CircuitState::HALF_OPEN:
            return true;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++totalSuccesses_;

    if (state_ == domain::CircuitState::HALF_OPEN) {
        ++halfOpenSuccesses_;
        if (halfOpenSuccesses_ >= config_.halfOpenLimit) {
            changeState(domain::CircuitState::CLOSED);
        }
    } else if (state_ == domain::CircuitState::CLOSED) {
        consecutiveFailures_ = 0;
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++consecutiveFailures_;
    ++totalFailures_;
    lastFailureTime_ = clock_->now();

    if (state_ == domain::CircuitState::CLOSED && consecutiveFailures_ >= config_.failureThreshold) {
        changeState(domain::CircuitState::OPEN);
    } else if (state_ == domain::CircuitState::HALF_OPEN) {
        changeState(domain::CircuitState::OPEN);
    }
}

domain::CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

domain::CircuitBreakerMetrics CircuitBreaker::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    domain::CircuitBreakerMetrics m;
    m.state = state_;
    m.consecutiveFailures = consecutiveFailures_;
    m.totalFailures = totalFailures_;
    m.totalSuccesses = totalSuccesses_;

    auto total = totalFailures_ + totalSuccesses_;
    m.failureRate = total > 0 ? static_cast<double>(totalFailures_) / static_cast<double>(total) : 0.0;

    if (!history_.empty()) {
        m.lastStateChange = history_.back();
    }

    auto dayAgo = clock_->now() - std::chrono::hours(24);
    m.stateChanges24h = static_cast<size_t>(std::count_if(
        history_.begin(), history_.end(),
        [dayAgo](const domain::StateTransition& t) { return t.timestamp >= dayAgo; }));

    return m;
}

std::vector<domain::StateTransition> CircuitBreaker::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

void CircuitBreaker::changeState(domain::CircuitState newState) {
    auto oldState = state_;
    state_ = newState;
    consecutiveFailures_ = 0;
    halfOpenSuccesses_ = 0;

    history_.push_back({clock_->now(), oldState, newState});
    while (history_.size() > config_.historyLimit) {
        history_.pop_front();
    }

    std::cerr << "[CircuitBreaker:" << name_ << "] state "
              << domain::toString(oldState) << " -> " << domain::toString(newState) << std::endl;
}

} // namespace apiclient::application
