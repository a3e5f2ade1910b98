#pragma once

#include "application/CacheManager.hpp"
#include "application/MetricsManager.hpp"
#include "domain/ApiRequest.hpp"
#include "domain/ApiResponse.hpp"
#include "ports/output/IClock.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace apiclient::application {

/**
 * @brief Кэширование GET ответов поверх CacheManager
 *
 * Ключ: "<путь без ведущего '/'>:<METHOD>:<параметры по имени>",
 * например "orders/42:GET:status=open". Путь идёт первым, чтобы
 * invalidate("orders") попадал во все чтения ресурса.
 *
 * Кэшируются только успешные ответы с данными. Попадания и промахи
 * пишутся в метрики cache_hits / cache_misses.
 */
class ResponseCache {
public:
    using Fetch = std::function<domain::JsonResponse()>;

    ResponseCache(
        std::shared_ptr<CacheManager> cache,
        std::shared_ptr<MetricsManager> metrics,
        std::shared_ptr<ports::output::IClock> clock
    );

    /**
     * @brief Ответ из кэша либо результат fetch() с записью в кэш
     *
     * Ошибки fetch() не кэшируются и пробрасываются как есть.
     */
    domain::JsonResponse getOrFetch(
        const std::string& path,
        const domain::Params& params,
        std::chrono::seconds ttl,
        const Fetch& fetch);

    void invalidate(const std::string& pathPrefix);

    /**
     * @brief Сброс после успешной записи: по первому сегменту пути
     *
     * "/orders/42/cancel" -> ключи "orders:..." и "orders/...",
     * "orders_archive" остаётся.
     */
    void invalidateForWrite(const std::string& path);

    static std::string makeKey(
        const std::string& method,
        const std::string& path,
        const domain::Params& params);

    static std::string normalizePath(const std::string& path);

    static std::string resourceOf(const std::string& path);

private:
    std::shared_ptr<CacheManager> cache_;
    std::shared_ptr<MetricsManager> metrics_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace apiclient::application
