#pragma once

#include "ports/output/IHealthProbe.hpp"
#include "ports/output/ISharedCache.hpp"
#include "ports/output/ITransport.hpp"
#include "settings/ApiClientConfig.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace apiclient::adapters::secondary {

/**
 * @brief GET <basePath><healthPath> на upstream, здоров при 2xx
 *
 * Использует собственную сессию, а не пул: проверка не должна
 * занимать слоты рабочих запросов.
 */
class HttpHealthProbe : public ports::output::IHealthProbe {
public:
    HttpHealthProbe(
        std::shared_ptr<ports::output::ITransportFactory> factory,
        settings::UpstreamConfig upstream,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)
    ) : factory_(std::move(factory))
      , upstream_(std::move(upstream))
      , timeout_(timeout)
    {}

    std::string name() const override {
        return upstream_.name;
    }

    bool probe() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_) {
            session_ = factory_->openSession(upstream_);
        }

        ports::output::TransportRequest request;
        request.method = "GET";
        request.path = upstream_.basePath + upstream_.healthPath;
        request.timeout = timeout_;

        auto response = session_->send(request);
        return response.statusCode >= 200 && response.statusCode < 300;
    }

private:
    std::shared_ptr<ports::output::ITransportFactory> factory_;
    settings::UpstreamConfig upstream_;
    std::chrono::milliseconds timeout_;

    std::mutex mutex_;
    std::unique_ptr<ports::output::ITransportSession> session_;
};

/**
 * @brief Запись и чтение служебного ключа в общем кэше
 */
class SharedCacheHealthProbe : public ports::output::IHealthProbe {
public:
    static constexpr const char* PROBE_KEY = "health:probe";

    explicit SharedCacheHealthProbe(std::shared_ptr<ports::output::ISharedCache> cache)
        : cache_(std::move(cache))
    {}

    std::string name() const override {
        return "cache";
    }

    bool probe() override {
        if (!cache_->setex(PROBE_KEY, 10, "ok")) {
            return false;
        }
        auto value = cache_->get(PROBE_KEY);
        return value && *value == "ok";
    }

private:
    std::shared_ptr<ports::output::ISharedCache> cache_;
};

} // namespace apiclient::adapters::secondary
