#pragma once

#include "application/CircuitBreaker.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ISharedCache.hpp"
#include "settings/ApiClientConfig.hpp"
#include <cache/Cache.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace apiclient::application {

/**
 * @brief Двухуровневый кэш ответов
 *
 * Локальный уровень (cpp-cache, LRU по ёмкости) - только проекция
 * общего хранилища: значение пишется локально лишь после успешной
 * записи в общее хранилище, и локальный TTL не превышает TTL там.
 * Попадание в общее хранилище кладётся локально, только если его
 * остаток TTL известен и положителен.
 *
 * Ошибки общего хранилища логируются и превращаются в промах,
 * наружу не выходят. Если передан breaker "cache-backend", пока он
 * открыт общее хранилище не опрашивается.
 */
class CacheManager {
public:
    CacheManager(
        std::shared_ptr<ports::output::ISharedCache> shared,
        settings::CacheConfig config,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<CircuitBreaker> sharedBreaker = nullptr
    );

    /**
     * @return nullopt при промахе (это не ошибка)
     */
    std::optional<std::string> get(const std::string& key);

    /**
     * @brief Записать с TTL по умолчанию
     */
    bool set(const std::string& key, const std::string& value);

    bool set(const std::string& key, const std::string& value, std::chrono::seconds ttl);

    bool remove(const std::string& key);

    /**
     * @brief Удалить все ключи с префиксом из обоих уровней
     *
     * Префикс, а не regex: в общем хранилище ищется "prefix*".
     */
    bool invalidatePattern(const std::string& prefix);

    size_t localSize() const;

    const settings::CacheConfig& config() const { return config_; }

private:
    struct LocalEntry {
        std::string value;
        domain::TimePoint expiresAt{};
    };

    using LocalCache = ThreadSafeCache<std::string, LocalEntry>;

    std::optional<std::string> getLocal(const std::string& key);
    void setLocal(const std::string& key, const std::string& value, std::chrono::seconds ttl);
    void removeLocal(const std::string& key);
    size_t removeLocalByPrefix(const std::string& prefix);

    bool sharedAllowed();
    void sharedSucceeded();
    void sharedFailed(const char* operation, const std::exception& e);

    std::shared_ptr<ports::output::ISharedCache> shared_;
    settings::CacheConfig config_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<CircuitBreaker> sharedBreaker_;

    mutable std::mutex localMutex_;
    std::unique_ptr<LocalCache> local_;
    std::set<std::string> localKeys_;   ///< для инвалидации по префиксу
};

} // namespace apiclient::application
