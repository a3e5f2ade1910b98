#pragma once

#include "application/CircuitBreaker.hpp"
#include "application/ConnectionPool.hpp"
#include "application/Diagnostics.hpp"
#include "application/MetricsManager.hpp"
#include "application/RateLimiter.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/ApiError.hpp"
#include "domain/ApiRequest.hpp"
#include "domain/ApiResponse.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ApiClientConfig.hpp"
#include <memory>
#include <string>

namespace apiclient::application {

/**
 * @brief Выполнение вызовов одного upstream
 *
 * Порядок шагов execute():
 * 1. circuit breaker: открыт -> CircuitOpenError, сеть не трогаем
 * 2. rate limiter: отказ -> RateLimitError(retryAfter), метрика rate_limits
 * 3. сессия из пула (Authorization добавляется здесь)
 * 4. HTTP вызов с таймаутом запроса или upstream
 * 5. классификация ответа (ResponseClassifier)
 * 6. api_latency, медленные запросы -> Diagnostics
 * 7. breaker: успех / неудача (+ api_errors и issue "api")
 * 8. сессия возвращается в пул на любом пути выхода
 *
 * request() - то же, но через RetryPolicy.
 *
 * Thread-safe: да, все зависимости потокобезопасны.
 */
class RequestOrchestrator {
public:
    RequestOrchestrator(
        settings::UpstreamConfig upstream,
        std::shared_ptr<ConnectionPool> pool,
        std::shared_ptr<RateLimiter> rateLimiter,
        std::shared_ptr<CircuitBreaker> breaker,
        std::shared_ptr<MetricsManager> metrics,
        std::shared_ptr<Diagnostics> diagnostics,
        std::shared_ptr<ports::output::IClock> clock,
        settings::RetryConfig retry,
        settings::DiagnosticsConfig diagnosticsConfig
    );

    /**
     * @brief Вызов с повторами при ServerError / RateLimitError
     * @throws domain::ApiError
     */
    domain::JsonResponse request(const domain::ApiRequest& request);

    /**
     * @brief Одна попытка без повторов
     * @throws domain::ApiError
     */
    domain::JsonResponse execute(const domain::ApiRequest& request);

    const settings::UpstreamConfig& upstream() const { return upstream_; }
    const std::shared_ptr<ConnectionPool>& pool() const { return pool_; }
    const std::shared_ptr<CircuitBreaker>& breaker() const { return breaker_; }
    const std::shared_ptr<RateLimiter>& rateLimiter() const { return rateLimiter_; }

    /**
     * @brief basePath + "/" + path без ведущего '/'
     */
    std::string resolvePath(const std::string& path) const;

private:
    void checkCircuit();
    void checkRateLimit(const domain::ApiRequest& request);
    ConnectionPool::Lease acquireSession(const domain::ApiRequest& request);

    ports::output::TransportResponse send(
        ports::output::ITransportSession& session,
        const domain::ApiRequest& request);

    /**
     * @brief api_latency и медленный запрос; status - код ответа или класс ошибки транспорта
     */
    void recordLatency(
        const domain::ApiRequest& request,
        const std::string& status,
        size_t responseSize,
        double durationSeconds);

    void recordFailure(const domain::ApiRequest& request, const domain::ApiError& error);

    std::string hostLabel() const;

    settings::UpstreamConfig upstream_;
    std::shared_ptr<ConnectionPool> pool_;
    std::shared_ptr<RateLimiter> rateLimiter_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<MetricsManager> metrics_;
    std::shared_ptr<Diagnostics> diagnostics_;
    std::shared_ptr<ports::output::IClock> clock_;
    RetryPolicy retry_;
    settings::DiagnosticsConfig diagnosticsConfig_;
};

} // namespace apiclient::application
