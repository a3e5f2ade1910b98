#pragma once

#include <optional>
#include <string>
#include <vector>

namespace apiclient::ports::output {

/**
 * @brief Общее (распределённое) хранилище кэша
 *
 * Контракт повторяет подмножество команд Redis: GET, SETEX, DEL, KEYS, TTL.
 * Реализация сама отвечает за потокобезопасность. Методы могут бросать
 * исключения при недоступности хранилища.
 */
class ISharedCache {
public:
    virtual ~ISharedCache() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual bool setex(const std::string& key, int ttlSeconds, const std::string& value) = 0;

    /**
     * @return true если ключ существовал
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @param pattern glob шаблон ("orders*")
     */
    virtual std::vector<std::string> keys(const std::string& pattern) = 0;

    /**
     * @brief Оставшееся время жизни ключа в секундах
     * @return nullopt если ключа нет или у него нет срока жизни
     */
    virtual std::optional<int> ttl(const std::string& key) = 0;
};

} // namespace apiclient::ports::output
