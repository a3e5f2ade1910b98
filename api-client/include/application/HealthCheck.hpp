#pragma once

#include "ports/output/IClock.hpp"
#include "ports/output/IHealthProbe.hpp"
#include "settings/ApiClientConfig.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apiclient::application {

/**
 * @brief Проверки доступности зависимостей с кэшированием результата
 *
 * Результат каждой проверки живёт HealthConfig::cacheFor. Исключение
 * из probe() означает "недоступен".
 */
class HealthCheck {
public:
    HealthCheck(
        std::vector<std::shared_ptr<ports::output::IHealthProbe>> probes,
        settings::HealthConfig config,
        std::shared_ptr<ports::output::IClock> clock
    );

    /**
     * @brief Результаты по всем сервисам (из кэша, если он свежий)
     */
    std::map<std::string, bool> check();

    /**
     * @brief Проверить всё заново, игнорируя кэш
     */
    std::map<std::string, bool> refresh();

    bool isHealthy(const std::string& service);

    void addProbe(std::shared_ptr<ports::output::IHealthProbe> probe);

private:
    struct CachedResult {
        bool healthy = false;
        domain::TimePoint checkedAt{};
    };

    bool runProbe(ports::output::IHealthProbe& probe);

    std::map<std::string, bool> collect(bool force);

    settings::HealthConfig config_;
    std::shared_ptr<ports::output::IClock> clock_;

    std::mutex mutex_;
    std::vector<std::shared_ptr<ports::output::IHealthProbe>> probes_;
    std::map<std::string, CachedResult> cache_;
};

} // namespace apiclient::application
