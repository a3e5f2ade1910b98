#include "application/RequestOrchestrator.hpp"
#include "application/ResponseClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace apiclient::application {

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

RequestOrchestrator::RequestOrchestrator(
    settings::UpstreamConfig upstream,
    std::shared_ptr<ConnectionPool> pool,
    std::shared_ptr<RateLimiter> rateLimiter,
    std::shared_ptr<CircuitBreaker> breaker,
    std::shared_ptr<MetricsManager> metrics,
    std::shared_ptr<Diagnostics> diagnostics,
    std::shared_ptr<ports::output::IClock> clock,
    settings::RetryConfig retry,
    settings::DiagnosticsConfig diagnosticsConfig
) : upstream_(std::move(upstream))
  , pool_(std::move(pool))
  , rateLimiter_(std::move(rateLimiter))
  , breaker_(std::move(breaker))
  , metrics_(std::move(metrics))
  , diagnostics_(std::move(diagnostics))
  , clock_(clock)
  , retry_(retry, clock)
  , diagnosticsConfig_(diagnosticsConfig)
{
    std::cout << "[RequestOrchestrator:" << upstream_.name << "] Target: "
              << hostLabel() << upstream_.basePath << std::endl;
}

domain::JsonResponse RequestOrchestrator::request(const domain::ApiRequest& request) {
    return retry_.execute([this, &request]() {
        return execute(request);
    });
}

domain::JsonResponse RequestOrchestrator::execute(const domain::ApiRequest& request) {
    checkCircuit();
    checkRateLimit(request);

    auto session = acquireSession(request);
    auto started = clock_->now();
    bool latencyRecorded = false;

    try {
        auto transportResponse = send(*session, request);
        auto finished = clock_->now();

        recordLatency(request, std::to_string(transportResponse.statusCode),
                      transportResponse.body.size(), domain::secondsBetween(started, finished));
        latencyRecorded = true;

        auto response = ResponseClassifier::classify(transportResponse, domain::Timestamp(finished));
        breaker_->recordSuccess();
        return response;
    } catch (const domain::ApiError& e) {
        if (!latencyRecorded) {
            recordLatency(request, domain::toString(e.kind()), 0,
                          domain::secondsBetween(started, clock_->now()));
        }
        recordFailure(request, e);
        throw;
    } catch (const std::exception& e) {
        domain::ApiError error(std::string("Request failed: ") + e.what());
        if (!latencyRecorded) {
            recordLatency(request, domain::toString(error.kind()), 0,
                          domain::secondsBetween(started, clock_->now()));
        }
        recordFailure(request, error);
        throw error;
    }
}

void RequestOrchestrator::checkCircuit() {
    if (!breaker_->allowRequest()) {
        throw domain::CircuitOpenError(breaker_->name());
    }
}

void RequestOrchestrator::checkRateLimit(const domain::ApiRequest& request) {
    auto decision = rateLimiter_->isAllowed(request.path);
    if (decision.allowed) {
        return;
    }

    int retryAfter = decision.retryAfter.value_or(1);
    metrics_->record("rate_limits", 1, {{"endpoint", request.path}});
    diagnostics_->recordIssue(
        "rate_limit",
        domain::Severity::WARNING,
        "Rate limit exceeded for " + request.path,
        {{"endpoint", request.path}, {"retry_after", retryAfter}});

    throw domain::RateLimitError(
        "Rate limit exceeded", retryAfter, 429, nlohmann::json{{"message", "Too many requests"}});
}

ConnectionPool::Lease RequestOrchestrator::acquireSession(const domain::ApiRequest& request) {
    try {
        return pool_->acquire();
    } catch (const domain::ConnectionExhaustedError& e) {
        diagnostics_->recordIssue(
            "connection_pool",
            domain::Severity::WARNING,
            e.what(),
            {{"endpoint", request.path}, {"max_size", pool_->maxSize()}});
        throw;
    } catch (const ports::output::TransportConnectionError& e) {
        diagnostics_->recordConnectionIssue(hostLabel(), e.what(), "NetworkError", {{"endpoint", request.path}});
        domain::NetworkError error(std::string("Network error: ") + e.what());
        recordFailure(request, error);
        throw error;
    }
}

ports::output::TransportResponse RequestOrchestrator::send(
    ports::output::ITransportSession& session,
    const domain::ApiRequest& request
) {
    ports::output::TransportRequest transportRequest;
    transportRequest.method = toUpper(request.method);
    transportRequest.path = resolvePath(request.path);
    transportRequest.params = request.params;
    transportRequest.timeout = request.timeout.value_or(upstream_.timeout);

    if (!upstream_.authToken.empty()) {
        transportRequest.headers["Authorization"] = "Bearer " + upstream_.authToken;
    }
    for (const auto& [name, value] : request.headers) {
        transportRequest.headers[name] = value;
    }

    if (request.body) {
        transportRequest.body = request.body->dump();
    }

    try {
        return session.send(transportRequest);
    } catch (const ports::output::TransportTimeoutError& e) {
        diagnostics_->recordConnectionIssue(hostLabel(), e.what(), "TimeoutError", {{"endpoint", request.path}});
        throw domain::TimeoutError(std::string("Request timed out: ") + e.what());
    } catch (const ports::output::TransportConnectionError& e) {
        diagnostics_->recordConnectionIssue(hostLabel(), e.what(), "NetworkError", {{"endpoint", request.path}});
        throw domain::NetworkError(std::string("Network error: ") + e.what());
    }
}

void RequestOrchestrator::recordLatency(
    const domain::ApiRequest& request,
    const std::string& status,
    size_t responseSize,
    double durationSeconds
) {
    metrics_->record("api_latency", durationSeconds, {
        {"method", toUpper(request.method)},
        {"endpoint", request.path},
        {"status", status}
    });

    auto threshold = std::chrono::duration<double>(diagnosticsConfig_.slowRequestThreshold).count();
    if (durationSeconds > threshold) {
        diagnostics_->recordSlowRequest(request.path, durationSeconds, {
            {"method", toUpper(request.method)},
            {"status", status},
            {"size", responseSize}
        });
    }
}

void RequestOrchestrator::recordFailure(const domain::ApiRequest& request, const domain::ApiError& error) {
    metrics_->record("api_errors", 1, {
        {"endpoint", request.path},
        {"type", domain::toString(error.kind())}
    });
    breaker_->recordFailure();

    nlohmann::json context = {
        {"endpoint", request.path},
        {"method", toUpper(request.method)},
        {"error", error.what()},
        {"error_type", error.typeName()}
    };
    context["status_code"] = error.statusCode() ? nlohmann::json(*error.statusCode()) : nlohmann::json();

    diagnostics_->recordIssue(
        "api",
        domain::Severity::ERROR,
        std::string("API request failed: ") + error.what(),
        context);
}

std::string RequestOrchestrator::resolvePath(const std::string& path) const {
    auto start = path.find_first_not_of('/');
    auto relative = start == std::string::npos ? std::string() : path.substr(start);

    auto base = upstream_.basePath;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + relative;
}

std::string RequestOrchestrator::hostLabel() const {
    return upstream_.host + ":" + std::to_string(upstream_.port);
}

} // namespace apiclient::application
