#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/Diagnostics.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/MockPorts.hpp"

using namespace apiclient;
using namespace apiclient::application;
using namespace std::chrono_literals;
using domain::Severity;
using ::testing::Return;
using ::testing::Throw;

class DiagnosticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<tests::FakeClock>();
        config_.issueHistoryLimit = 5;
        config_.errorPatternThreshold = 3;
        config_.slowEndpointMinCount = 2;
        config_.resourceUsageThreshold = 80.0;
    }

    std::unique_ptr<Diagnostics> make(std::shared_ptr<ports::output::ISystemMonitor> monitor = nullptr) {
        return std::make_unique<Diagnostics>(config_, clock_, monitor);
    }

    static bool hasIssue(const std::vector<domain::Issue>& issues,
                         const std::string& category, const std::string& message) {
        for (const auto& issue : issues) {
            if (issue.category == category && issue.message == message) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<tests::FakeClock> clock_;
    settings::DiagnosticsConfig config_;
};

// ============================================================================
// Учёт проблем
// ============================================================================

TEST_F(DiagnosticsTest, EmptySnapshot_HasZeroSeverityBuckets) {
    auto diagnostics = make();

    auto snapshot = diagnostics->getDiagnostics();

    EXPECT_EQ(snapshot.currentIssues, 0u);
    EXPECT_EQ(snapshot.totalIssues, 0u);
    EXPECT_EQ(snapshot.bySeverity.at("error"), 0u);
    EXPECT_EQ(snapshot.bySeverity.at("warning"), 0u);
    EXPECT_EQ(snapshot.bySeverity.at("info"), 0u);
    EXPECT_TRUE(snapshot.byCategory.empty());
}

TEST_F(DiagnosticsTest, RecordIssue_CountedBySeverityAndCategory) {
    auto diagnostics = make();

    diagnostics->recordIssue("api", Severity::ERROR, "API request failed: boom");
    diagnostics->recordIssue("rate_limit", Severity::WARNING, "Rate limit exceeded for /orders");
    diagnostics->recordIssue("api", Severity::INFO, "note");

    auto snapshot = diagnostics->getDiagnostics();

    EXPECT_EQ(snapshot.totalIssues, 3u);
    EXPECT_EQ(snapshot.currentIssues, 2u);  // info не считается
    EXPECT_EQ(snapshot.bySeverity.at("error"), 1u);
    EXPECT_EQ(snapshot.bySeverity.at("warning"), 1u);
    EXPECT_EQ(snapshot.bySeverity.at("info"), 1u);
    EXPECT_EQ(snapshot.byCategory.at("api"), 2u);
    EXPECT_EQ(snapshot.byCategory.at("rate_limit"), 1u);
}

TEST_F(DiagnosticsTest, RecordIssue_StoresTimestampAndContext) {
    auto diagnostics = make();

    diagnostics->recordIssue("api", Severity::ERROR, "failed", {{"endpoint", "/orders"}});

    auto issues = diagnostics->recentIssues(10);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].timestamp, clock_->now());
    EXPECT_EQ(issues[0].context["endpoint"], "/orders");
}

TEST_F(DiagnosticsTest, History_BoundedAndCategoriesFollowEviction) {
    auto diagnostics = make();

    diagnostics->recordIssue("old", Severity::WARNING, "first");
    diagnostics->recordIssue("old", Severity::WARNING, "second");
    for (int i = 0; i < 5; ++i) {
        diagnostics->recordIssue("api", Severity::ERROR, "error " + std::to_string(i));
    }

    auto snapshot = diagnostics->getDiagnostics();

    EXPECT_EQ(snapshot.totalIssues, 5u);
    EXPECT_EQ(snapshot.byCategory.count("old"), 0u);
    EXPECT_EQ(snapshot.byCategory.at("api"), 5u);

    size_t sum = 0;
    for (const auto& [category, count] : snapshot.byCategory) {
        sum += count;
    }
    EXPECT_EQ(sum, snapshot.totalIssues);
}

TEST_F(DiagnosticsTest, RecentIssues_ReturnsNewestLast) {
    auto diagnostics = make();
    diagnostics->recordIssue("a", Severity::INFO, "1");
    diagnostics->recordIssue("a", Severity::INFO, "2");
    diagnostics->recordIssue("a", Severity::INFO, "3");

    auto issues = diagnostics->recentIssues(2);

    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].message, "2");
    EXPECT_EQ(issues[1].message, "3");
}

TEST_F(DiagnosticsTest, ConnectionIssues_SummaryKeepsLastError) {
    auto diagnostics = make();

    diagnostics->recordConnectionIssue("api.local:443", "refused", "ConnectionError");
    diagnostics->recordConnectionIssue("api.local:443", "timed out", "Timeout");

    auto snapshot = diagnostics->getDiagnostics();
    const auto& summary = snapshot.connectionIssues.at("api.local:443");

    EXPECT_EQ(summary.count, 2u);
    ASSERT_TRUE(summary.lastError.has_value());
    EXPECT_EQ(*summary.lastError, "timed out");
}

TEST_F(DiagnosticsTest, SlowRequests_AveragedPerEndpoint) {
    auto diagnostics = make();

    diagnostics->recordSlowRequest("/reports", 2.0);
    diagnostics->recordSlowRequest("/reports", 4.0);

    auto snapshot = diagnostics->getDiagnostics();
    const auto& slow = snapshot.slowEndpoints.at("/reports");

    EXPECT_EQ(slow.count, 2u);
    EXPECT_DOUBLE_EQ(slow.avgDuration, 3.0);
}

TEST_F(DiagnosticsTest, SlowRequests_OlderThanRetentionPruned) {
    auto diagnostics = make();
    diagnostics->recordSlowRequest("/reports", 2.0);

    clock_->advance(config_.eventRetention + 1s);
    diagnostics->recordSlowRequest("/reports", 5.0);

    auto snapshot = diagnostics->getDiagnostics();
    EXPECT_EQ(snapshot.slowEndpoints.at("/reports").count, 1u);
    EXPECT_DOUBLE_EQ(snapshot.slowEndpoints.at("/reports").avgDuration, 5.0);
}

// ============================================================================
// Самоанализ
// ============================================================================

TEST_F(DiagnosticsTest, SelfCheck_FrequentErrorTypeReported) {
    auto diagnostics = make();
    for (int i = 0; i < 3; ++i) {
        diagnostics->recordIssue("api", Severity::ERROR, "failed", {{"error_type", "TimeoutError"}});
    }
    EXPECT_EQ(diagnostics->getDiagnostics().errorPatterns.at("TimeoutError"), 3u);

    diagnostics->runSelfCheck();

    auto issues = diagnostics->recentIssues(10);
    EXPECT_TRUE(hasIssue(issues, "errors", "Frequent error pattern detected: TimeoutError"));
    // Счётчики шаблонов сбрасываются после проверки
    EXPECT_TRUE(diagnostics->getDiagnostics().errorPatterns.empty());
}

TEST_F(DiagnosticsTest, SelfCheck_RareErrorTypeIgnored) {
    auto diagnostics = make();
    diagnostics->recordIssue("api", Severity::ERROR, "failed", {{"error_type", "ServerError"}});

    diagnostics->runSelfCheck();

    EXPECT_FALSE(hasIssue(diagnostics->recentIssues(10), "errors",
                          "Frequent error pattern detected: ServerError"));
}

TEST_F(DiagnosticsTest, SelfCheck_SlowEndpointReportedWithAverage) {
    auto diagnostics = make();
    diagnostics->recordSlowRequest("/reports", 1.5);
    diagnostics->recordSlowRequest("/reports", 2.5);
    diagnostics->recordSlowRequest("/users", 3.0);

    diagnostics->runSelfCheck();

    auto issues = diagnostics->recentIssues(10);
    EXPECT_TRUE(hasIssue(issues, "performance", "Slow endpoint detected: /reports"));
    EXPECT_FALSE(hasIssue(issues, "performance", "Slow endpoint detected: /users"));

    for (const auto& issue : issues) {
        if (issue.category == "performance") {
            EXPECT_DOUBLE_EQ(issue.context["avg_duration"].get<double>(), 2.0);
            EXPECT_EQ(issue.context["request_count"].get<size_t>(), 2u);
            EXPECT_EQ(issue.severity, Severity::WARNING);
        }
    }
}

TEST_F(DiagnosticsTest, SelfCheck_HighResourceUsageReported) {
    auto monitor = std::make_shared<tests::MockSystemMonitor>();
    ports::output::SystemUsage usage;
    usage.cpuPercent = 95.0;
    usage.memoryPercent = 40.0;
    usage.diskPercent = 81.0;
    EXPECT_CALL(*monitor, sample()).WillOnce(Return(usage));
    auto diagnostics = make(monitor);

    diagnostics->runSelfCheck();

    auto issues = diagnostics->recentIssues(10);
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].category, "system");
    EXPECT_EQ(issues[0].message, "High cpu usage: 95%");
    EXPECT_EQ(issues[1].message, "High disk usage: 81%");
}

TEST_F(DiagnosticsTest, SelfCheck_MonitorFailureDoesNotStopOtherChecks) {
    auto monitor = std::make_shared<tests::MockSystemMonitor>();
    EXPECT_CALL(*monitor, sample()).WillOnce(Throw(std::runtime_error("/proc unavailable")));
    auto diagnostics = make(monitor);
    diagnostics->recordSlowRequest("/reports", 2.0);
    diagnostics->recordSlowRequest("/reports", 2.0);

    EXPECT_NO_THROW(diagnostics->runSelfCheck());

    EXPECT_TRUE(hasIssue(diagnostics->recentIssues(10), "performance", "Slow endpoint detected: /reports"));
}

TEST_F(DiagnosticsTest, SelfCheck_DropsIssuesOlderThanDay) {
    auto diagnostics = make();
    diagnostics->recordIssue("api", Severity::ERROR, "old failure");
    diagnostics->recordConnectionIssue("api.local:443", "refused", "ConnectionError");

    clock_->advance(25h);
    diagnostics->runSelfCheck();

    auto snapshot = diagnostics->getDiagnostics();
    EXPECT_EQ(snapshot.currentIssues, 0u);
    EXPECT_EQ(snapshot.totalIssues, 0u);
    EXPECT_TRUE(snapshot.byCategory.empty());
    EXPECT_TRUE(snapshot.connectionIssues.empty());
}

TEST_F(DiagnosticsTest, SnapshotToJson_HasSections) {
    auto diagnostics = make();
    diagnostics->recordIssue("api", Severity::ERROR, "failed");

    auto json = diagnostics->getDiagnostics().toJson();

    EXPECT_EQ(json["issues"]["total"], 1);
    EXPECT_EQ(json["issues"]["by_severity"]["error"], 1);
    EXPECT_TRUE(json.contains("performance"));
    EXPECT_TRUE(json.contains("connections"));
    EXPECT_TRUE(json.contains("error_patterns"));
}
