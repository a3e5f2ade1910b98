#pragma once

#include "ports/output/IClock.hpp"
#include "ports/output/ISharedCache.hpp"
#include <chrono>
#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace apiclient::adapters::secondary {

/**
 * @brief Общее хранилище кэша в памяти процесса
 *
 * Семантика команд как у Redis: SETEX с TTL в секундах, KEYS с glob
 * шаблоном ('*' и '?'), TTL возвращает остаток в секундах (вверх).
 * Просроченные ключи удаляются при обращении к ним.
 */
class InMemorySharedCache : public ports::output::ISharedCache {
public:
    explicit InMemorySharedCache(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock))
    {}

    std::optional<std::string> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLive(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    bool setex(const std::string& key, int ttlSeconds, const std::string& value) override {
        if (ttlSeconds <= 0) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = {value, clock_->now() + std::chrono::seconds(ttlSeconds)};
        return true;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLive(key);
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    std::vector<std::string> keys(const std::string& pattern) override {
        std::lock_guard<std::mutex> lock(mutex_);
        purgeExpired();

        std::vector<std::string> result;
        for (const auto& [key, entry] : entries_) {
            if (globMatch(pattern, key)) {
                result.push_back(key);
            }
        }
        return result;
    }

    std::optional<int> ttl(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLive(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        auto remaining = std::chrono::duration<double>(it->second.expiresAt - clock_->now()).count();
        return static_cast<int>(std::ceil(remaining));
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        purgeExpired();
        return entries_.size();
    }

    /**
     * @brief Сопоставление glob шаблона: '*' - любая строка, '?' - один символ
     */
    static bool globMatch(const std::string& pattern, const std::string& text) {
        size_t p = 0, t = 0;
        size_t starPos = std::string::npos, matchPos = 0;

        while (t < text.size()) {
            if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
                ++p;
                ++t;
            } else if (p < pattern.size() && pattern[p] == '*') {
                starPos = p++;
                matchPos = t;
            } else if (starPos != std::string::npos) {
                p = starPos + 1;
                t = ++matchPos;
            } else {
                return false;
            }
        }

        while (p < pattern.size() && pattern[p] == '*') {
            ++p;
        }
        return p == pattern.size();
    }

private:
    struct Entry {
        std::string value;
        domain::TimePoint expiresAt;
    };

    using Entries = std::map<std::string, Entry>;

    // Вызывается под mutex_
    Entries::iterator findLive(const std::string& key) {
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.expiresAt <= clock_->now()) {
            entries_.erase(it);
            return entries_.end();
        }
        return it;
    }

    void purgeExpired() {
        auto now = clock_->now();
        for (auto it = entries_.begin(); it != entries_.end();) {
            it = it->second.expiresAt <= now ? entries_.erase(it) : std::next(it);
        }
    }

    std::shared_ptr<ports::output::IClock> clock_;
    std::mutex mutex_;
    Entries entries_;
};

} // namespace apiclient::adapters::secondary
