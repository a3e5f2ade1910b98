#include "application/Diagnostics.hpp"
#include <boost/stacktrace.hpp>
#include <algorithm>
#include <iostream>
#include <numeric>
#include <sstream>
#include <utility>

namespace apiclient::application {

namespace {

struct Finding {
    std::string category;
    std::string message;
    nlohmann::json context;
};

double averageDuration(const std::vector<double>& durations) {
    if (durations.empty()) {
        return 0.0;
    }
    return std::accumulate(durations.begin(), durations.end(), 0.0) / static_cast<double>(durations.size());
}

} // namespace

Diagnostics::Diagnostics(
    settings::DiagnosticsConfig config,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<ports::output::ISystemMonitor> systemMonitor
) : config_(config)
  , clock_(std::move(clock))
  , systemMonitor_(std::move(systemMonitor))
{}

void Diagnostics::recordIssue(
    const std::string& category,
    domain::Severity severity,
    const std::string& message,
    const nlohmann::json& context
) {
    domain::Issue issue;
    issue.category = category;
    issue.severity = severity;
    issue.message = message;
    issue.context = context.is_object() ? context : nlohmann::json::object();
    issue.stackSnapshot = captureStack();

    std::lock_guard<std::mutex> lock(mutex_);
    issue.timestamp = clock_->now();

    history_.push_back(issue);
    ++categoryTally_[category];
    while (history_.size() > config_.issueHistoryLimit) {
        auto& evicted = history_.front();
        if (--categoryTally_[evicted.category] == 0) {
            categoryTally_.erase(evicted.category);
        }
        history_.pop_front();
    }

    if (severity == domain::Severity::ERROR) {
        errors_.push_back(issue);
    } else if (severity == domain::Severity::WARNING) {
        warnings_.push_back(issue);
    }

    auto errorType = issue.context.find("error_type");
    if (errorType != issue.context.end() && errorType->is_string()) {
        ++errorPatterns_[errorType->get<std::string>()];
    }
}

void Diagnostics::recordSlowRequest(
    const std::string& endpoint,
    double durationSeconds,
    const nlohmann::json& context
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    auto& events = slowRequests_[endpoint];
    events.push_back({now, durationSeconds, context});
    pruneOlderThan(events, now - config_.eventRetention);
}

void Diagnostics::recordConnectionIssue(
    const std::string& host,
    const std::string& error,
    const std::string& errorType,
    const nlohmann::json& context
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_->now();
    auto& events = connectionIssues_[host];
    events.push_back({now, error, errorType, context});
    pruneOlderThan(events, now - config_.eventRetention);
}

void Diagnostics::runSelfCheck() {
    try {
        checkSystemHealth();
    } catch (const std::exception& e) {
        std::cerr << "[Diagnostics] System health check failed: " << e.what() << std::endl;
    }

    analyzeErrorPatterns();
    checkPerformance();
    cleanupOldData();
}

void Diagnostics::checkSystemHealth() {
    if (!systemMonitor_) {
        return;
    }

    auto usage = systemMonitor_->sample();
    const std::pair<const char*, double> readings[] = {
        {"cpu", usage.cpuPercent},
        {"memory", usage.memoryPercent},
        {"disk", usage.diskPercent}
    };

    for (const auto& [resource, percent] : readings) {
        if (percent > config_.resourceUsageThreshold) {
            std::ostringstream message;
            message << "High " << resource << " usage: " << percent << "%";
            recordIssue("system", domain::Severity::WARNING, message.str(),
                        {{std::string(resource) + "_percent", percent}});
        }
    }
}

void Diagnostics::analyzeErrorPatterns() {
    std::vector<Finding> findings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [errorType, count] : errorPatterns_) {
            if (count >= config_.errorPatternThreshold) {
                findings.push_back({
                    "errors",
                    "Frequent error pattern detected: " + errorType,
                    {{"error_type_detected", errorType}, {"count", count}}
                });
            }
        }
    }

    for (const auto& f : findings) {
        recordIssue(f.category, domain::Severity::WARNING, f.message, f.context);
    }
}

void Diagnostics::checkPerformance() {
    std::vector<Finding> findings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cutoff = clock_->now() - config_.eventRetention;
        for (auto& [endpoint, events] : slowRequests_) {
            pruneOlderThan(events, cutoff);
            if (events.size() < config_.slowEndpointMinCount) {
                continue;
            }

            std::vector<double> durations;
            durations.reserve(events.size());
            for (const auto& e : events) {
                durations.push_back(e.duration);
            }

            findings.push_back({
                "performance",
                "Slow endpoint detected: " + endpoint,
                {
                    {"endpoint", endpoint},
                    {"avg_duration", averageDuration(durations)},
                    {"request_count", events.size()}
                }
            });
        }
    }

    for (const auto& f : findings) {
        recordIssue(f.category, domain::Severity::WARNING, f.message, f.context);
    }
}

void Diagnostics::cleanupOldData() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = clock_->now() - config_.issueRetention;

    pruneOlderThan(errors_, cutoff);
    pruneOlderThan(warnings_, cutoff);

    while (!history_.empty() && history_.front().timestamp < cutoff) {
        auto& evicted = history_.front();
        if (--categoryTally_[evicted.category] == 0) {
            categoryTally_.erase(evicted.category);
        }
        history_.pop_front();
    }

    auto eventCutoff = clock_->now() - config_.eventRetention;
    for (auto it = slowRequests_.begin(); it != slowRequests_.end();) {
        pruneOlderThan(it->second, eventCutoff);
        it = it->second.empty() ? slowRequests_.erase(it) : std::next(it);
    }
    for (auto it = connectionIssues_.begin(); it != connectionIssues_.end();) {
        pruneOlderThan(it->second, eventCutoff);
        it = it->second.empty() ? connectionIssues_.erase(it) : std::next(it);
    }

    // Счётчики шаблонов считаются заново в каждом интервале самоанализа
    errorPatterns_.clear();
}

domain::DiagnosticsSnapshot Diagnostics::getDiagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    domain::DiagnosticsSnapshot snapshot;
    snapshot.currentIssues = errors_.size() + warnings_.size();
    snapshot.totalIssues = history_.size();

    snapshot.bySeverity = {{"error", 0}, {"warning", 0}, {"info", 0}};
    for (const auto& issue : history_) {
        ++snapshot.bySeverity[domain::toString(issue.severity)];
    }
    snapshot.byCategory = categoryTally_;

    for (const auto& [endpoint, events] : slowRequests_) {
        if (events.empty()) {
            continue;
        }
        std::vector<double> durations;
        for (const auto& e : events) {
            durations.push_back(e.duration);
        }
        snapshot.slowEndpoints[endpoint] = {events.size(), averageDuration(durations)};
    }

    for (const auto& [host, events] : connectionIssues_) {
        domain::ConnectionIssueSummary summary;
        summary.count = events.size();
        if (!events.empty()) {
            summary.lastError = events.back().error;
        }
        snapshot.connectionIssues[host] = summary;
    }

    snapshot.errorPatterns = errorPatterns_;
    return snapshot;
}

std::vector<domain::Issue> Diagnostics::recentIssues(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto count = std::min(limit, history_.size());
    return {history_.end() - static_cast<std::ptrdiff_t>(count), history_.end()};
}

template <typename Event>
void Diagnostics::pruneOlderThan(std::vector<Event>& events, domain::TimePoint cutoff) {
    events.erase(
        std::remove_if(events.begin(), events.end(),
            [cutoff](const Event& e) { return e.timestamp < cutoff; }),
        events.end());
}

std::string Diagnostics::captureStack() {
    // Пропускаем captureStack и recordIssue
    return boost::stacktrace::to_string(boost::stacktrace::stacktrace(2, 16));
}

} // namespace apiclient::application
