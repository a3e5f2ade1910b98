#pragma once

#include "settings/IApiClientSettings.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

namespace apiclient::settings {

/**
 * @brief Настройки клиента из переменных окружения
 *
 * Читает из ENV (в скобках значение по умолчанию):
 * - API_HOST (localhost), API_PORT (8000), API_BASE_PATH (/api/v1)
 * - API_AUTH_TOKEN (пусто), API_TIMEOUT_MS (30000)
 * - API_MAX_RETRIES (3), API_RETRY_BASE_DELAY_MS (1000)
 * - RATE_LIMIT_MAX_REQUESTS (100), RATE_LIMIT_WINDOW_MS (60000)
 * - POOL_MAX_SIZE (10), POOL_ACQUIRE_TIMEOUT_MS (30000)
 * - CB_FAILURE_THRESHOLD (5), CB_RECOVERY_TIMEOUT_SECONDS (60), CB_HALF_OPEN_LIMIT (3)
 * - CACHE_LOCAL_CAPACITY (10000), CACHE_LOCAL_TTL_CAP_SECONDS (60), CACHE_DEFAULT_TTL_SECONDS (300)
 * - SLOW_REQUEST_THRESHOLD_MS (1000)
 * - PANEL_HOST (не задан -> панель не используется), PANEL_PORT (80), PANEL_BASE_PATH (пусто)
 */
class EnvApiClientSettings : public IApiClientSettings {
public:
    EnvApiClientSettings() {
        auto& api = config_.api;
        api.host = envString("API_HOST", api.host);
        api.port = envInt("API_PORT", api.port);
        api.basePath = envString("API_BASE_PATH", api.basePath);
        api.authToken = envString("API_AUTH_TOKEN", api.authToken);
        api.timeout = milliseconds(envInt("API_TIMEOUT_MS", static_cast<int>(api.timeout.count())));

        config_.retry.maxAttempts = envInt("API_MAX_RETRIES", config_.retry.maxAttempts);
        config_.retry.baseDelay = milliseconds(
            envInt("API_RETRY_BASE_DELAY_MS", static_cast<int>(config_.retry.baseDelay.count())));

        config_.rateLimit.maxRequests = envSize("RATE_LIMIT_MAX_REQUESTS", config_.rateLimit.maxRequests);
        config_.rateLimit.window = milliseconds(
            envInt("RATE_LIMIT_WINDOW_MS", static_cast<int>(config_.rateLimit.window.count())));

        config_.pool.maxSize = envSize("POOL_MAX_SIZE", config_.pool.maxSize);
        config_.pool.acquireTimeout = milliseconds(
            envInt("POOL_ACQUIRE_TIMEOUT_MS", static_cast<int>(config_.pool.acquireTimeout.count())));

        auto& cb = config_.circuitBreaker;
        cb.failureThreshold = envInt("CB_FAILURE_THRESHOLD", cb.failureThreshold);
        cb.recoveryTimeout = seconds(
            envInt("CB_RECOVERY_TIMEOUT_SECONDS", static_cast<int>(cb.recoveryTimeout.count())));
        cb.halfOpenLimit = envInt("CB_HALF_OPEN_LIMIT", cb.halfOpenLimit);

        auto& cache = config_.cache;
        cache.localCapacity = envSize("CACHE_LOCAL_CAPACITY", cache.localCapacity);
        cache.localTtlCap = seconds(
            envInt("CACHE_LOCAL_TTL_CAP_SECONDS", static_cast<int>(cache.localTtlCap.count())));
        cache.defaultTtl = seconds(
            envInt("CACHE_DEFAULT_TTL_SECONDS", static_cast<int>(cache.defaultTtl.count())));

        config_.diagnostics.slowRequestThreshold = milliseconds(envInt(
            "SLOW_REQUEST_THRESHOLD_MS",
            static_cast<int>(config_.diagnostics.slowRequestThreshold.count())));

        if (const char* panelHost = std::getenv("PANEL_HOST")) {
            UpstreamConfig panel;
            panel.name = "panel";
            panel.host = panelHost;
            panel.port = envInt("PANEL_PORT", 80);
            panel.basePath = envString("PANEL_BASE_PATH", "");
            panel.userAgent = api.userAgent;
            panel.timeout = api.timeout;
            config_.panel = panel;
        }
    }

    ApiClientConfig getConfig() const override {
        return config_;
    }

private:
    static std::string envString(const char* name, const std::string& fallback) {
        const char* val = std::getenv(name);
        return val ? val : fallback;
    }

    static int envInt(const char* name, int fallback) {
        const char* val = std::getenv(name);
        return val ? std::stoi(val) : fallback;
    }

    /**
     * @brief Размер/лимит: значение <= 0 игнорируется, берётся fallback
     */
    static size_t envSize(const char* name, size_t fallback) {
        int value = envInt(name, static_cast<int>(fallback));
        if (value <= 0) {
            std::cerr << "[EnvApiClientSettings] " << name << "=" << value
                      << " must be positive, using " << fallback << std::endl;
            return fallback;
        }
        return static_cast<size_t>(value);
    }

    ApiClientConfig config_;
};

} // namespace apiclient::settings
