#pragma once

#include "domain/Metric.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ApiClientConfig.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apiclient::application {

/**
 * @brief Оконные числовые метрики в памяти
 *
 * record() дописывает измерение в последовательность по имени.
 * getStats() считает агрегаты по хвостовому окну; для пустого окна
 * возвращает нулевые агрегаты. compact() удаляет измерения старше
 * retention и вызывается периодически из ApiClientRuntime.
 */
class MetricsManager {
public:
    MetricsManager(settings::MetricsConfig config, std::shared_ptr<ports::output::IClock> clock);

    void record(const std::string& name, double value, const domain::Labels& labels = {});

    /**
     * @brief Агрегаты за окно по умолчанию (MetricsConfig::defaultWindow)
     */
    domain::MetricStats getStats(const std::string& name) const;

    domain::MetricStats getStats(const std::string& name, std::chrono::milliseconds window) const;

    /**
     * @brief Удалить измерения старше retention
     * @return сколько измерений удалено
     */
    size_t compact();

    std::vector<std::string> names() const;

    size_t sampleCount(const std::string& name) const;

    /**
     * @brief Агрегаты по отсортированной выборке
     */
    static domain::MetricStats computeStats(std::vector<double> values);

private:
    settings::MetricsConfig config_;
    std::shared_ptr<ports::output::IClock> clock_;

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<domain::Metric>> series_;
};

} // namespace apiclient::application
