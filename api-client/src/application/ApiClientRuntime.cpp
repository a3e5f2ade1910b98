#include "application/ApiClientRuntime.hpp"
#include <iostream>

namespace apiclient::application {

namespace {

const char* const STATUS_METRICS[] = {
    "api_latency",
    "api_errors",
    "cache_hits",
    "cache_misses",
    "rate_limits"
};

const std::string SYSTEM_METRIC_PREFIX = "system_";

bool isReadMethod(const std::string& method) {
    return method == "GET" || method == "get" || method == "HEAD" || method == "head";
}

domain::ApiRequest makeRequest(const std::string& method, const std::string& path) {
    domain::ApiRequest request;
    request.method = method;
    request.path = path;
    return request;
}

} // namespace

ApiClientRuntime::ApiClientRuntime(
    std::shared_ptr<settings::IApiClientSettings> settings,
    std::shared_ptr<ports::output::ITransportFactory> transportFactory,
    std::shared_ptr<ports::output::ISharedCache> sharedCache,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<ports::output::ISystemMonitor> systemMonitor
) : config_(settings->getConfig())
  , clock_(std::move(clock))
  , systemMonitor_(std::move(systemMonitor))
{
    metrics_ = std::make_shared<MetricsManager>(config_.metrics, clock_);
    diagnostics_ = std::make_shared<Diagnostics>(config_.diagnostics, clock_, systemMonitor_);

    cache_ = std::make_shared<CacheManager>(
        std::move(sharedCache), config_.cache, clock_, registerBreaker(CACHE_BREAKER));
    responseCache_ = std::make_shared<ResponseCache>(cache_, metrics_, clock_);

    health_ = std::make_shared<HealthCheck>(
        std::vector<std::shared_ptr<ports::output::IHealthProbe>>{}, config_.health, clock_);

    api_ = makeOrchestrator(config_.api, transportFactory);
    if (config_.panel) {
        panel_ = makeOrchestrator(*config_.panel, transportFactory);
    }

    std::cout << "[ApiClientRuntime] Created: api=" << config_.api.host << ":" << config_.api.port
              << (panel_ ? ", panel=" + config_.panel->host : std::string())
              << ", " << breakers_.size() << " circuit breakers" << std::endl;
}

ApiClientRuntime::~ApiClientRuntime() {
    stop();
}

std::shared_ptr<CircuitBreaker> ApiClientRuntime::registerBreaker(const std::string& name) {
    return breakers_.getOrCreate(name, [this, &name]() {
        return std::make_shared<CircuitBreaker>(name, config_.circuitBreaker, clock_);
    });
}

std::shared_ptr<RequestOrchestrator> ApiClientRuntime::makeOrchestrator(
    const settings::UpstreamConfig& upstream,
    const std::shared_ptr<ports::output::ITransportFactory>& transportFactory
) {
    // Имя upstream совпадает с именем его breaker'а
    return std::make_shared<RequestOrchestrator>(
        upstream,
        std::make_shared<ConnectionPool>(transportFactory, upstream, config_.pool),
        std::make_shared<RateLimiter>(config_.rateLimit, clock_),
        registerBreaker(upstream.name),
        metrics_,
        diagnostics_,
        clock_,
        config_.retry,
        config_.diagnostics);
}

std::shared_ptr<CircuitBreaker> ApiClientRuntime::breaker(const std::string& name) const {
    return breakers_.find(name);
}

// ============================================
// IApiClient
// ============================================

domain::JsonResponse ApiClientRuntime::request(const domain::ApiRequest& request) {
    auto response = api_->request(request);

    if (!isReadMethod(request.method)) {
        responseCache_->invalidateForWrite(request.path);
    }
    return response;
}

domain::JsonResponse ApiClientRuntime::get(const std::string& path, const domain::Params& params) {
    auto req = makeRequest("GET", path);
    req.params = params;
    return request(req);
}

domain::JsonResponse ApiClientRuntime::post(const std::string& path, const nlohmann::json& body) {
    auto req = makeRequest("POST", path);
    req.body = body;
    return request(req);
}

domain::JsonResponse ApiClientRuntime::put(const std::string& path, const nlohmann::json& body) {
    auto req = makeRequest("PUT", path);
    req.body = body;
    return request(req);
}

domain::JsonResponse ApiClientRuntime::patch(const std::string& path, const nlohmann::json& body) {
    auto req = makeRequest("PATCH", path);
    req.body = body;
    return request(req);
}

domain::JsonResponse ApiClientRuntime::del(const std::string& path) {
    return request(makeRequest("DELETE", path));
}

domain::JsonResponse ApiClientRuntime::getCached(
    const std::string& path,
    const domain::Params& params,
    std::optional<std::chrono::seconds> ttl
) {
    return responseCache_->getOrFetch(
        path, params, ttl.value_or(config_.cache.defaultTtl),
        [this, &path, &params]() { return get(path, params); });
}

void ApiClientRuntime::invalidate(const std::string& pathPrefix) {
    responseCache_->invalidate(pathPrefix);
}

std::map<std::string, bool> ApiClientRuntime::checkHealth() {
    return health_->check();
}

domain::ClientStatus ApiClientRuntime::getStatus() {
    domain::ClientStatus status;
    status.health = health_->check();

    for (const char* name : STATUS_METRICS) {
        status.metrics[name] = metrics_->getStats(name);
    }
    for (const auto& name : metrics_->names()) {
        if (name.compare(0, SYSTEM_METRIC_PREFIX.size(), SYSTEM_METRIC_PREFIX) == 0) {
            status.metrics[name] = metrics_->getStats(name);
        }
    }

    status.diagnostics = diagnostics_->getDiagnostics();

    for (const auto& [name, breaker] : breakers_.snapshot()) {
        status.circuitBreakers[name] = breaker->metrics();
    }

    status.connections[api_->upstream().name] = api_->pool()->stats();
    size_t rateLimiterKeys = api_->rateLimiter()->trackedKeys();
    if (panel_) {
        status.connections[panel_->upstream().name] = panel_->pool()->stats();
        rateLimiterKeys += panel_->rateLimiter()->trackedKeys();
    }

    status.localCacheSize = cache_->localSize();
    status.rateLimiterKeys = rateLimiterKeys;
    return status;
}

// ============================================
// Lifecycle
// ============================================

void ApiClientRuntime::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!tasks_.empty()) {
        return;
    }

    tasks_.push_back(std::make_unique<PeriodicTask>(
        "metrics-compaction", config_.metrics.compactionInterval,
        [this]() { metrics_->compact(); }));
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "diagnostics", config_.diagnostics.checkInterval,
        [this]() { diagnostics_->runSelfCheck(); }));
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "monitoring", config_.health.monitorInterval,
        [this]() { runMonitoringCycle(); }));

    for (auto& task : tasks_) {
        task->start();
    }

    std::cout << "[ApiClientRuntime] Started " << tasks_.size() << " background tasks" << std::endl;
}

void ApiClientRuntime::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (tasks_.empty()) {
        return;
    }

    for (auto& task : tasks_) {
        task->stop();
    }
    tasks_.clear();

    std::cout << "[ApiClientRuntime] Background tasks stopped" << std::endl;
}

bool ApiClientRuntime::isRunning() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return !tasks_.empty();
}

void ApiClientRuntime::addHealthProbe(std::shared_ptr<ports::output::IHealthProbe> probe) {
    health_->addProbe(std::move(probe));
}

void ApiClientRuntime::runMonitoringCycle() {
    if (systemMonitor_) {
        try {
            auto usage = systemMonitor_->sample();
            for (const auto& [name, value] : usage.asMetrics()) {
                metrics_->record(SYSTEM_METRIC_PREFIX + name, value);
            }
        } catch (const std::exception& e) {
            std::cerr << "[ApiClientRuntime] System sample failed: " << e.what() << std::endl;
        }
    }

    health_->refresh();
}

} // namespace apiclient::application
