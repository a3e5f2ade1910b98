#pragma once

#include "domain/DiagnosticsSnapshot.hpp"
#include "domain/Issue.hpp"
#include "domain/enums/Severity.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ISystemMonitor.hpp"
#include "settings/ApiClientConfig.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apiclient::application {

/**
 * @brief Журнал проблем клиента и периодический самоанализ
 *
 * Пассивная часть: recordIssue / recordSlowRequest / recordConnectionIssue.
 * Активная часть: runSelfCheck() (вызывается фоновой задачей ApiClientRuntime)
 * проверяет ресурсы процесса, повторяющиеся ошибки и медленные endpoints,
 * каждую находку записывает через recordIssue, затем чистит данные старше суток.
 *
 * getDiagnostics() возвращает копию - внутренние структуры наружу не отдаются.
 */
class Diagnostics {
public:
    Diagnostics(
        settings::DiagnosticsConfig config,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::ISystemMonitor> systemMonitor = nullptr
    );

    void recordIssue(
        const std::string& category,
        domain::Severity severity,
        const std::string& message,
        const nlohmann::json& context = nlohmann::json::object());

    /**
     * @param durationSeconds длительность запроса в секундах
     */
    void recordSlowRequest(
        const std::string& endpoint,
        double durationSeconds,
        const nlohmann::json& context = nlohmann::json::object());

    void recordConnectionIssue(
        const std::string& host,
        const std::string& error,
        const std::string& errorType,
        const nlohmann::json& context = nlohmann::json::object());

    void runSelfCheck();

    domain::DiagnosticsSnapshot getDiagnostics() const;

    /**
     * @brief Последние записи из кольцевой истории (новые в конце)
     */
    std::vector<domain::Issue> recentIssues(size_t limit) const;

private:
    struct SlowRequest {
        domain::TimePoint timestamp;
        double duration;
        nlohmann::json context;
    };

    struct ConnectionEvent {
        domain::TimePoint timestamp;
        std::string error;
        std::string errorType;
        nlohmann::json context;
    };

    void checkSystemHealth();
    void analyzeErrorPatterns();
    void checkPerformance();
    void cleanupOldData();

    template <typename Event>
    static void pruneOlderThan(std::vector<Event>& events, domain::TimePoint cutoff);

    static std::string captureStack();

    settings::DiagnosticsConfig config_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::ISystemMonitor> systemMonitor_;

    mutable std::mutex mutex_;
    std::deque<domain::Issue> history_;                  ///< последние issueHistoryLimit
    std::map<std::string, size_t> categoryTally_;        ///< по записям в history_
    std::vector<domain::Issue> errors_;                  ///< за issueRetention
    std::vector<domain::Issue> warnings_;                ///< за issueRetention
    std::map<std::string, size_t> errorPatterns_;        ///< context.error_type -> count
    std::map<std::string, std::vector<SlowRequest>> slowRequests_;
    std::map<std::string, std::vector<ConnectionEvent>> connectionIssues_;
};

} // namespace apiclient::application
