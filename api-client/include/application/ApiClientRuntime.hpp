#pragma once

#include "application/CacheManager.hpp"
#include "application/CircuitBreaker.hpp"
#include "application/ConnectionPool.hpp"
#include "application/Diagnostics.hpp"
#include "application/HealthCheck.hpp"
#include "application/MetricsManager.hpp"
#include "application/PeriodicTask.hpp"
#include "application/RateLimiter.hpp"
#include "application/RequestOrchestrator.hpp"
#include "application/ResponseCache.hpp"
#include "ports/input/IApiClient.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IHealthProbe.hpp"
#include "ports/output/ISharedCache.hpp"
#include "ports/output/ISystemMonitor.hpp"
#include "ports/output/ITransport.hpp"
#include "settings/IApiClientSettings.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apiclient::application {

/**
 * @brief Единственный экземпляр клиента на процесс
 *
 * Собирает компоненты из портов и настроек, держит реестр circuit
 * breaker'ов ("api", "cache-backend", "panel") и три фоновые задачи:
 * - metrics-compaction: MetricsManager::compact()
 * - diagnostics: Diagnostics::runSelfCheck()
 * - monitoring: метрики system_* и обновление health checks
 *
 * Фоновые задачи запускаются только в start(), деструктор вызывает stop().
 */
class ApiClientRuntime : public ports::input::IApiClient {
public:
    static constexpr const char* API_BREAKER = "api";
    static constexpr const char* CACHE_BREAKER = "cache-backend";
    static constexpr const char* PANEL_BREAKER = "panel";

    ApiClientRuntime(
        std::shared_ptr<settings::IApiClientSettings> settings,
        std::shared_ptr<ports::output::ITransportFactory> transportFactory,
        std::shared_ptr<ports::output::ISharedCache> sharedCache,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::ISystemMonitor> systemMonitor
    );

    ~ApiClientRuntime() override;

    ApiClientRuntime(const ApiClientRuntime&) = delete;
    ApiClientRuntime& operator=(const ApiClientRuntime&) = delete;

    // ============================================
    // IApiClient
    // ============================================

    domain::JsonResponse request(const domain::ApiRequest& request) override;

    domain::JsonResponse get(const std::string& path, const domain::Params& params = {}) override;
    domain::JsonResponse post(const std::string& path, const nlohmann::json& body) override;
    domain::JsonResponse put(const std::string& path, const nlohmann::json& body) override;
    domain::JsonResponse patch(const std::string& path, const nlohmann::json& body) override;
    domain::JsonResponse del(const std::string& path) override;

    domain::JsonResponse getCached(
        const std::string& path,
        const domain::Params& params = {},
        std::optional<std::chrono::seconds> ttl = std::nullopt) override;

    void invalidate(const std::string& pathPrefix) override;

    domain::ClientStatus getStatus() override;

    std::map<std::string, bool> checkHealth() override;

    // ============================================
    // Lifecycle
    // ============================================

    void start();
    void stop();
    bool isRunning() const;

    void addHealthProbe(std::shared_ptr<ports::output::IHealthProbe> probe);

    /**
     * @brief Одна итерация задачи monitoring (system_* + health)
     */
    void runMonitoringCycle();

    // ============================================
    // Компоненты
    // ============================================

    /**
     * @brief Вызовы панели; nullptr если панель не настроена
     */
    std::shared_ptr<RequestOrchestrator> panel() const { return panel_; }

    std::shared_ptr<RequestOrchestrator> api() const { return api_; }
    std::shared_ptr<CircuitBreaker> breaker(const std::string& name) const;
    std::shared_ptr<CacheManager> cache() const { return cache_; }
    std::shared_ptr<MetricsManager> metrics() const { return metrics_; }
    std::shared_ptr<Diagnostics> diagnostics() const { return diagnostics_; }
    std::shared_ptr<HealthCheck> health() const { return health_; }

    const settings::ApiClientConfig& config() const { return config_; }

private:
    std::shared_ptr<CircuitBreaker> registerBreaker(const std::string& name);

    std::shared_ptr<RequestOrchestrator> makeOrchestrator(
        const settings::UpstreamConfig& upstream,
        const std::shared_ptr<ports::output::ITransportFactory>& transportFactory);

    settings::ApiClientConfig config_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::ISystemMonitor> systemMonitor_;

    ThreadSafeMap<std::string, CircuitBreaker> breakers_;

    std::shared_ptr<MetricsManager> metrics_;
    std::shared_ptr<Diagnostics> diagnostics_;
    std::shared_ptr<CacheManager> cache_;
    std::shared_ptr<ResponseCache> responseCache_;
    std::shared_ptr<HealthCheck> health_;
    std::shared_ptr<RequestOrchestrator> api_;
    std::shared_ptr<RequestOrchestrator> panel_;

    mutable std::mutex lifecycleMutex_;
    std::vector<std::unique_ptr<PeriodicTask>> tasks_;
};

} // namespace apiclient::application
