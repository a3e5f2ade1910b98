#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <string>

namespace apiclient::domain {

using Labels = std::map<std::string, std::string>;

/**
 * @brief Одно измерение метрики
 */
struct Metric {
    TimePoint timestamp;
    double value;
    Labels labels;
};

/**
 * @brief Агрегаты метрики за окно
 *
 * p95 - элемент отсортированной выборки с индексом floor(0.95 * n),
 * без интерполяции.
 */
struct MetricStats {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double p95 = 0.0;

    nlohmann::json toJson() const {
        return {
            {"count", count},
            {"min", min},
            {"max", max},
            {"mean", mean},
            {"median", median},
            {"p95", p95}
        };
    }
};

} // namespace apiclient::domain
