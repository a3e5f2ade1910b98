#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace apiclient::settings {

using std::chrono::milliseconds;
using std::chrono::seconds;

/**
 * @brief Параметры одного upstream (backend API или панель)
 *
 * name совпадает с именем circuit breaker ("api", "panel").
 */
struct UpstreamConfig {
    std::string name = "api";
    std::string host = "localhost";
    int port = 8000;
    std::string basePath = "/api/v1";
    std::string authToken;                       ///< пусто -> без Authorization
    std::string userAgent = "ApiClientRuntime/1.0";
    std::string healthPath = "/health";
    milliseconds timeout{30000};                 ///< таймаут HTTP вызова по умолчанию
};

/**
 * @brief Пул транспортных сессий
 */
struct PoolConfig {
    size_t maxSize = 10;
    milliseconds acquireTimeout{30000};          ///< отдельно от HTTP таймаута
};

/**
 * @brief Скользящее окно: не более maxRequests за window на ключ
 */
struct RateLimitConfig {
    size_t maxRequests = 100;
    milliseconds window{60000};
};

struct CircuitBreakerConfig {
    int failureThreshold = 5;
    seconds recoveryTimeout{60};
    int halfOpenLimit = 3;
    size_t historyLimit = 100;                   ///< сколько переходов хранить
};

/**
 * @brief Двухуровневый кэш
 *
 * Локальный TTL всегда <= TTL общего хранилища (ограничен localTtlCap).
 */
struct CacheConfig {
    size_t localCapacity = 10000;
    seconds localTtlCap{60};
    seconds defaultTtl{300};
};

/**
 * @brief Повторы: maxAttempts - общее число попыток
 *
 * Пауза: retry_after из ошибки либо baseDelay * 2^attempt.
 */
struct RetryConfig {
    int maxAttempts = 3;
    milliseconds baseDelay{1000};
};

struct MetricsConfig {
    seconds retention{3600};
    seconds compactionInterval{300};
    seconds defaultWindow{300};
};

struct DiagnosticsConfig {
    size_t issueHistoryLimit = 1000;
    size_t errorPatternThreshold = 10;
    size_t slowEndpointMinCount = 5;
    milliseconds slowRequestThreshold{1000};
    seconds eventRetention{3600};                ///< slow requests / connection issues
    seconds issueRetention{86400};
    double resourceUsageThreshold = 80.0;        ///< проценты cpu/memory/disk
    seconds checkInterval{300};
};

struct HealthConfig {
    seconds cacheFor{60};
    seconds monitorInterval{60};
};

/**
 * @brief Полная конфигурация клиента
 *
 * panel задаётся только если настроен PANEL_HOST.
 */
struct ApiClientConfig {
    UpstreamConfig api;
    std::optional<UpstreamConfig> panel;
    PoolConfig pool;
    RateLimitConfig rateLimit;
    CircuitBreakerConfig circuitBreaker;
    CacheConfig cache;
    RetryConfig retry;
    MetricsConfig metrics;
    DiagnosticsConfig diagnostics;
    HealthConfig health;
};

} // namespace apiclient::settings
