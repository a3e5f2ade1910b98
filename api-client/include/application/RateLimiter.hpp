#pragma once

#include "ports/output/IClock.hpp"
#include "settings/ApiClientConfig.hpp"
#include <chrono>
#include <cmath>
#include <cstddef>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace apiclient::application {

/**
 * @brief Результат проверки лимита
 */
struct RateDecision {
    bool allowed = true;
    std::optional<int> retryAfter;   ///< секунды, только если !allowed
};

/**
 * @brief Скользящее окно запросов по ключу (обычно endpoint)
 *
 * Метка считается вне окна, если now - ts >= window (граница
 * освобождает слот). Пустые окна удаляются при каждом вызове,
 * отдельного потока очистки нет.
 *
 * Thread-safe: да, один мьютекс на всю карту.
 */
class RateLimiter {
public:
    RateLimiter(settings::RateLimitConfig config, std::shared_ptr<ports::output::IClock> clock)
        : config_(config)
        , clock_(std::move(clock))
    {
        std::cout << "[RateLimiter] Created: " << config_.maxRequests << " requests / "
                  << config_.window.count() << "ms" << std::endl;
    }

    RateDecision isAllowed(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        collectExpiredKeys(now);

        auto& window = windows_[key];
        while (!window.empty() && now - window.front() >= config_.window) {
            window.pop_front();
        }

        if (window.size() >= config_.maxRequests) {
            auto remaining = std::chrono::duration<double>(
                window.front() + config_.window - now).count();
            int retryAfter = static_cast<int>(std::ceil(remaining));
            return {false, retryAfter > 0 ? retryAfter : 1};
        }

        window.push_back(now);
        return {true, std::nullopt};
    }

    /**
     * @brief Количество ключей с непустым окном
     */
    size_t trackedKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return windows_.size();
    }

    const settings::RateLimitConfig& config() const { return config_; }

private:
    using Window = std::deque<domain::TimePoint>;

    void collectExpiredKeys(domain::TimePoint now) {
        for (auto it = windows_.begin(); it != windows_.end();) {
            if (it->second.empty() || now - it->second.back() >= config_.window) {
                it = windows_.erase(it);
            } else {
                ++it;
            }
        }
    }

    settings::RateLimitConfig config_;
    std::shared_ptr<ports::output::IClock> clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
};

} // namespace apiclient::application
