#pragma once

#include "domain/ApiRequest.hpp"
#include "domain/ApiResponse.hpp"
#include "domain/ClientStatus.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace apiclient::ports::input {

/**
 * @brief Input Port: устойчивый клиент upstream API
 *
 * Все методы возвращают нормализованный ApiResponse либо бросают
 * domain::ApiError (или наследника).
 */
class IApiClient {
public:
    virtual ~IApiClient() = default;

    virtual domain::JsonResponse request(const domain::ApiRequest& request) = 0;

    virtual domain::JsonResponse get(const std::string& path, const domain::Params& params = {}) = 0;

    virtual domain::JsonResponse post(const std::string& path, const nlohmann::json& body) = 0;

    virtual domain::JsonResponse put(const std::string& path, const nlohmann::json& body) = 0;

    virtual domain::JsonResponse patch(const std::string& path, const nlohmann::json& body) = 0;

    virtual domain::JsonResponse del(const std::string& path) = 0;

    /**
     * @brief GET через кэш ответов
     * @param ttl nullopt -> CacheConfig::defaultTtl
     */
    virtual domain::JsonResponse getCached(
        const std::string& path,
        const domain::Params& params = {},
        std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;

    /**
     * @brief Сбросить закэшированные ответы по префиксу пути
     */
    virtual void invalidate(const std::string& pathPrefix) = 0;

    virtual domain::ClientStatus getStatus() = 0;

    /**
     * @brief Только health checks (с кэшем результатов), без метрик
     */
    virtual std::map<std::string, bool> checkHealth() = 0;
};

} // namespace apiclient::ports::input
