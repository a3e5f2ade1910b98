#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Реестр разделяемых объектов по ключу
 *
 * Значения хранятся как shared_ptr: объект, полученный через find(),
 * остаётся живым даже после erase() или перезаписи ключа.
 * Чтение под shared_lock, запись под unique_lock.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вернуть существующее значение или создать через factory
     *
     * factory вызывается не больше одного раза на ключ.
     */
    std::shared_ptr<V> getOrCreate(const K &key, const std::function<std::shared_ptr<V>()> &factory)
    {
        if (auto existing = find(key))
        {
            return existing;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
        {
            return it->second;
        }
        auto created = factory();
        map_.emplace(key, created);
        return created;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    /**
     * @brief Копия содержимого; порядок не определён
     */
    std::vector<std::pair<K, std::shared_ptr<V>>> snapshot() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return {map_.begin(), map_.end()};
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
