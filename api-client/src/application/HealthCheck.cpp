#include "application/HealthCheck.hpp"
#include <iostream>

namespace apiclient::application {

HealthCheck::HealthCheck(
    std::vector<std::shared_ptr<ports::output::IHealthProbe>> probes,
    settings::HealthConfig config,
    std::shared_ptr<ports::output::IClock> clock
) : config_(config)
  , clock_(std::move(clock))
  , probes_(std::move(probes))
{
    std::cout << "[HealthCheck] Created with " << probes_.size() << " probes" << std::endl;
}

std::map<std::string, bool> HealthCheck::check() {
    return collect(false);
}

std::map<std::string, bool> HealthCheck::refresh() {
    return collect(true);
}

bool HealthCheck::isHealthy(const std::string& service) {
    auto results = collect(false);
    auto it = results.find(service);
    return it != results.end() && it->second;
}

void HealthCheck::addProbe(std::shared_ptr<ports::output::IHealthProbe> probe) {
    std::lock_guard<std::mutex> lock(mutex_);
    probes_.push_back(std::move(probe));
}

std::map<std::string, bool> HealthCheck::collect(bool force) {
    std::vector<std::shared_ptr<ports::output::IHealthProbe>> probes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        probes = probes_;
    }

    std::map<std::string, bool> results;

    for (const auto& probe : probes) {
        auto name = probe->name();
        auto now = clock_->now();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = cache_.find(name);
            if (!force && it != cache_.end() && now - it->second.checkedAt < config_.cacheFor) {
                results[name] = it->second.healthy;
                continue;
            }
        }

        // Сама проверка - сетевой вызов, выполняется без блокировки
        bool healthy = runProbe(*probe);

        std::lock_guard<std::mutex> lock(mutex_);
        cache_[name] = {healthy, clock_->now()};
        results[name] = healthy;
    }

    return results;
}

bool HealthCheck::runProbe(ports::output::IHealthProbe& probe) {
    try {
        bool healthy = probe.probe();
        if (!healthy) {
            std::cerr << "[HealthCheck] " << probe.name() << " is unhealthy" << std::endl;
        }
        return healthy;
    } catch (const std::exception& e) {
        std::cerr << "[HealthCheck] " << probe.name() << " check failed: " << e.what() << std::endl;
        return false;
    }
}

} // namespace apiclient::application
