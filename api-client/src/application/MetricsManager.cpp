#include "application/MetricsManager.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>

namespace apiclient::application {

MetricsManager::MetricsManager(settings::MetricsConfig config, std::shared_ptr<ports::output::IClock> clock)
    : config_(config)
    , clock_(std::move(clock))
{}

void MetricsManager::record(const std::string& name, double value, const domain::Labels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    series_[name].push_back({clock_->now(), value, labels});
}

domain::MetricStats MetricsManager::getStats(const std::string& name) const {
    return getStats(name, config_.defaultWindow);
}

domain::MetricStats MetricsManager::getStats(const std::string& name, std::chrono::milliseconds window) const {
    auto cutoff = clock_->now() - window;
    std::vector<double> values;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = series_.find(name);
        if (it == series_.end()) {
            return {};
        }

        // Последовательность упорядочена по времени - идём с конца
        const auto& samples = it->second;
        for (auto s = samples.rbegin(); s != samples.rend() && s->timestamp >= cutoff; ++s) {
            values.push_back(s->value);
        }
    }

    return computeStats(std::move(values));
}

size_t MetricsManager::compact() {
    auto cutoff = clock_->now() - config_.retention;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = series_.begin(); it != series_.end();) {
        auto& samples = it->second;
        auto firstKept = std::find_if(samples.begin(), samples.end(),
            [cutoff](const domain::Metric& m) { return m.timestamp >= cutoff; });
        removed += static_cast<size_t>(std::distance(samples.begin(), firstKept));
        samples.erase(samples.begin(), firstKept);

        if (samples.empty()) {
            it = series_.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        std::cout << "[MetricsManager] Compacted " << removed << " samples" << std::endl;
    }
    return removed;
}

std::vector<std::string> MetricsManager::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(series_.size());
    for (const auto& [name, _] : series_) {
        result.push_back(name);
    }
    return result;
}

size_t MetricsManager::sampleCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(name);
    return it == series_.end() ? 0 : it->second.size();
}

domain::MetricStats MetricsManager::computeStats(std::vector<double> values) {
    domain::MetricStats stats;
    if (values.empty()) {
        return stats;
    }

    std::sort(values.begin(), values.end());
    auto n = values.size();

    stats.count = n;
    stats.min = values.front();
    stats.max = values.back();
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(n);
    stats.median = (n % 2 == 1)
        ? values[n / 2]
        : (values[n / 2 - 1] + values[n / 2]) / 2.0;
    // floor(0.95 * n) без погрешности double
    stats.p95 = values[(n * 95) / 100];
    return stats;
}

} // namespace apiclient::application
