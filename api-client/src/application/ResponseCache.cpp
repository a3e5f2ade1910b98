#include "application/ResponseCache.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace apiclient::application {

ResponseCache::ResponseCache(
    std::shared_ptr<CacheManager> cache,
    std::shared_ptr<MetricsManager> metrics,
    std::shared_ptr<ports::output::IClock> clock
) : cache_(std::move(cache))
  , metrics_(std::move(metrics))
  , clock_(std::move(clock))
{}

domain::JsonResponse ResponseCache::getOrFetch(
    const std::string& path,
    const domain::Params& params,
    std::chrono::seconds ttl,
    const Fetch& fetch
) {
    auto key = makeKey("GET", path, params);

    if (auto cached = cache_->get(key)) {
        auto data = nlohmann::json::parse(*cached, nullptr, false);
        if (!data.is_discarded()) {
            metrics_->record("cache_hits", 1, {{"endpoint", path}});
            return domain::JsonResponse::fromCache(std::move(data), domain::Timestamp(clock_->now()));
        }

        std::cerr << "[ResponseCache] Dropping corrupted entry " << key << std::endl;
        cache_->remove(key);
    }

    metrics_->record("cache_misses", 1, {{"endpoint", path}});

    auto response = fetch();
    if (response.success() && response.data()) {
        cache_->set(key, response.data()->dump(), ttl);
    }
    return response;
}

void ResponseCache::invalidate(const std::string& pathPrefix) {
    cache_->invalidatePattern(normalizePath(pathPrefix));
}

void ResponseCache::invalidateForWrite(const std::string& path) {
    auto resource = resourceOf(path);
    if (resource.empty()) {
        return;
    }
    // "orders:" - сам список, "orders/" - вложенные пути; "orders_archive" не трогаем
    cache_->invalidatePattern(resource + ":");
    cache_->invalidatePattern(resource + "/");
}

std::string ResponseCache::makeKey(
    const std::string& method,
    const std::string& path,
    const domain::Params& params
) {
    // std::map уже упорядочен по имени параметра
    std::string key = normalizePath(path) + ":" + method + ":";
    bool first = true;
    for (const auto& [name, value] : params) {
        if (!first) {
            key += "&";
        }
        key += name + "=" + value;
        first = false;
    }
    return key;
}

std::string ResponseCache::normalizePath(const std::string& path) {
    auto start = path.find_first_not_of('/');
    return start == std::string::npos ? std::string() : path.substr(start);
}

std::string ResponseCache::resourceOf(const std::string& path) {
    auto normalized = normalizePath(path);
    return normalized.substr(0, normalized.find('/'));
}

} // namespace apiclient::application
