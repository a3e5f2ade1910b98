#include "application/CacheManager.hpp"
#include <algorithm>
#include <iostream>

namespace apiclient::application {

CacheManager::CacheManager(
    std::shared_ptr<ports::output::ISharedCache> shared,
    settings::CacheConfig config,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<CircuitBreaker> sharedBreaker
) : shared_(std::move(shared))
  , config_(config)
  , clock_(std::move(clock))
  , sharedBreaker_(std::move(sharedBreaker))
{
    auto inner = std::make_unique<Cache<std::string, LocalEntry>>(
        config_.localCapacity,
        std::make_unique<LRUPolicy<std::string>>());
    local_ = std::make_unique<LocalCache>(std::move(inner));

    std::cout << "[CacheManager] Created with:"
              << " localCapacity=" << config_.localCapacity
              << " localTtlCap=" << config_.localTtlCap.count() << "s"
              << " defaultTtl=" << config_.defaultTtl.count() << "s"
              << std::endl;
}

std::optional<std::string> CacheManager::get(const std::string& key) {
    if (auto local = getLocal(key)) {
        return local;
    }

    if (!sharedAllowed()) {
        return std::nullopt;
    }

    try {
        auto value = shared_->get(key);
        if (value) {
            // Без известного остатка TTL локальная копия могла бы пережить общую
            auto remaining = shared_->ttl(key);
            if (remaining && *remaining > 0) {
                setLocal(key, *value, std::min(config_.localTtlCap, std::chrono::seconds(*remaining)));
            }
        }
        sharedSucceeded();
        return value;
    } catch (const std::exception& e) {
        sharedFailed("get", e);
        return std::nullopt;
    }
}

bool CacheManager::set(const std::string& key, const std::string& value) {
    return set(key, value, config_.defaultTtl);
}

bool CacheManager::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    if (ttl.count() <= 0 || !sharedAllowed()) {
        return false;
    }

    try {
        bool ok = shared_->setex(key, static_cast<int>(ttl.count()), value);
        if (ok) {
            setLocal(key, value, std::min(ttl, config_.localTtlCap));
        }
        sharedSucceeded();
        return ok;
    } catch (const std::exception& e) {
        sharedFailed("set", e);
        return false;
    }
}

bool CacheManager::remove(const std::string& key) {
    removeLocal(key);

    if (!sharedAllowed()) {
        return false;
    }

    try {
        bool removed = shared_->remove(key);
        sharedSucceeded();
        return removed;
    } catch (const std::exception& e) {
        sharedFailed("delete", e);
        return false;
    }
}

bool CacheManager::invalidatePattern(const std::string& prefix) {
    auto localRemoved = removeLocalByPrefix(prefix);

    if (!sharedAllowed()) {
        return false;
    }

    try {
        auto keys = shared_->keys(prefix + "*");
        for (const auto& key : keys) {
            shared_->remove(key);
        }
        sharedSucceeded();

        std::cout << "[CacheManager] Invalidated '" << prefix << "': shared=" << keys.size()
                  << " local=" << localRemoved << std::endl;
        return true;
    } catch (const std::exception& e) {
        sharedFailed("invalidate", e);
        return false;
    }
}

size_t CacheManager::localSize() const {
    std::lock_guard<std::mutex> lock(localMutex_);
    return local_->size();
}

std::optional<std::string> CacheManager::getLocal(const std::string& key) {
    std::lock_guard<std::mutex> lock(localMutex_);
    auto entry = local_->get(key);
    if (!entry) {
        localKeys_.erase(key);
        return std::nullopt;
    }

    if (clock_->now() >= entry->expiresAt) {
        local_->remove(key);
        localKeys_.erase(key);
        return std::nullopt;
    }

    return entry->value;
}

void CacheManager::setLocal(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(localMutex_);
    local_->put(key, LocalEntry{value, clock_->now() + ttl});
    localKeys_.insert(key);

    // Ключи, вытесненные LRU, остаются в индексе до первой чистки
    if (localKeys_.size() > 2 * config_.localCapacity) {
        for (auto it = localKeys_.begin(); it != localKeys_.end();) {
            if (!local_->contains(*it)) {
                it = localKeys_.erase(it);
            } else {
                ++it;
            }
        }
    }
}

void CacheManager::removeLocal(const std::string& key) {
    std::lock_guard<std::mutex> lock(localMutex_);
    local_->remove(key);
    localKeys_.erase(key);
}

size_t CacheManager::removeLocalByPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(localMutex_);
    size_t removed = 0;
    auto it = localKeys_.lower_bound(prefix);
    while (it != localKeys_.end() && it->compare(0, prefix.size(), prefix) == 0) {
        if (local_->remove(*it)) {
            ++removed;
        }
        it = localKeys_.erase(it);
    }
    return removed;
}

bool CacheManager::sharedAllowed() {
    return !sharedBreaker_ || sharedBreaker_->allowRequest();
}

void CacheManager::sharedSucceeded() {
    if (sharedBreaker_) {
        sharedBreaker_->recordSuccess();
    }
}

void CacheManager::sharedFailed(const char* operation, const std::exception& e) {
    std::cerr << "[CacheManager] Cache " << operation << " failed: " << e.what() << std::endl;
    if (sharedBreaker_) {
        sharedBreaker_->recordFailure();
    }
}

} // namespace apiclient::application
