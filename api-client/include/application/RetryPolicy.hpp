#pragma once

#include "domain/ApiError.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ApiClientConfig.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>

namespace apiclient::application {

/**
 * @brief Повтор вызова при ServerError / RateLimitError
 *
 * CircuitOpenError не повторяется. Всего не больше maxAttempts попыток.
 * Пауза перед следующей попыткой: retryAfter ошибки (секунды), если он
 * задан, иначе baseDelay * 2^attempt (показатель не больше MAX_BACKOFF_SHIFT).
 * Остальные ошибки пробрасываются сразу. После последней попытки
 * пауз нет, пробрасывается последняя ошибка.
 */
class RetryPolicy {
public:
    static constexpr int MAX_BACKOFF_SHIFT = 16;

    RetryPolicy(settings::RetryConfig config, std::shared_ptr<ports::output::IClock> clock)
        : config_(config)
        , clock_(std::move(clock))
    {}

    template <typename Fn>
    auto execute(Fn&& fn) -> decltype(fn()) {
        int attempts = config_.maxAttempts > 0 ? config_.maxAttempts : 1;

        for (int attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const domain::ApiError& e) {
                if (!e.isRetryable() || attempt + 1 >= attempts) {
                    throw;
                }

                auto delay = delayFor(e, attempt);
                std::cerr << "[RetryPolicy] " << e.typeName() << " on attempt " << (attempt + 1)
                          << "/" << attempts << ", retrying in " << delay.count() << "ms" << std::endl;
                clock_->sleepFor(delay);
            }
        }
    }

    /**
     * @brief Пауза после неудачной попытки attempt (с нуля)
     */
    std::chrono::milliseconds delayFor(const domain::ApiError& error, int attempt) const {
        if (error.retryAfter()) {
            return std::chrono::seconds(*error.retryAfter());
        }
        int shift = std::min(std::max(attempt, 0), MAX_BACKOFF_SHIFT);
        return config_.baseDelay * (1LL << shift);
    }

    const settings::RetryConfig& config() const { return config_; }

private:
    settings::RetryConfig config_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace apiclient::application
