#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/HealthProbes.hpp"
#include "adapters/secondary/HttpClientTransport.hpp"
#include "application/ConnectionPool.hpp"
#include <IHttpClient.hpp>
#include <SimpleResponse.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace apiclient;
using namespace apiclient::adapters::secondary;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

/**
 * @brief Upstream, который висит до openGate(), и счётчик вызовов в полёте
 */
class HangingHttpClient : public IHttpClient {
public:
    bool send(const IRequest&, IResponse& res) override {
        int now = ++inFlight_;
        ++calls_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}

        {
            std::unique_lock<std::mutex> lock(mutex_);
            gate_.wait_for(lock, std::chrono::seconds(2), [this]() { return open_; });
        }

        --inFlight_;
        dynamic_cast<SimpleResponse&>(res).setStatus(200);
        return true;
    }

    void openGate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        gate_.notify_all();
    }

    int calls() const { return calls_; }
    int peak() const { return peak_; }
    int inFlight() const { return inFlight_; }

private:
    std::atomic<int> inFlight_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};
    std::mutex mutex_;
    std::condition_variable gate_;
    bool open_ = false;
};

// ============================================================================
// Test Fixture
// ============================================================================

class HttpClientTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockHttpClient_ = std::make_shared<MockHttpClient>();
        upstream_.name = "api";
        upstream_.host = "api-service";
        upstream_.port = 8000;
        upstream_.basePath = "/api/v1";
        transport_ = std::make_unique<HttpClientTransport>(mockHttpClient_, upstream_);
    }

    static ports::output::TransportRequest makeRequest(const std::string& method, const std::string& path) {
        ports::output::TransportRequest request;
        request.method = method;
        request.path = path;
        request.timeout = 1000ms;
        return request;
    }

    // Хелпер: upstream отвечает статусом и телом
    void expectResponse(int status, const std::string& body,
                        std::map<std::string, std::string> headers = {}) {
        EXPECT_CALL(*mockHttpClient_, send(_, _))
            .WillOnce([status, body, headers](const IRequest&, IResponse& res) {
                // SimpleResponse нужно кастить для setStatus/setBody
                auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
                simpleRes.setStatus(status);
                simpleRes.setBody(body);
                for (const auto& [name, value] : headers) {
                    simpleRes.setHeader(name, value);
                }
                return true;
            });
    }

    std::shared_ptr<MockHttpClient> mockHttpClient_;
    settings::UpstreamConfig upstream_;
    std::unique_ptr<HttpClientTransport> transport_;
};

// ============================================================================
// ТЕСТЫ: send
// ============================================================================

TEST_F(HttpClientTransportTest, Send_PassesMethodPathBodyAndHeaders) {
    transport_->setDefaultHeader("Content-Type", "application/json");
    transport_->setDefaultHeader("User-Agent", "ApiClientRuntime/1.0");

    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "POST");
            EXPECT_EQ(req.getPath(), "/api/v1/orders");
            EXPECT_EQ(req.getBody(), R"({"qty":1})");

            auto headers = req.getHeaders();
            EXPECT_EQ(headers["Content-Type"], "application/json");
            EXPECT_EQ(headers["User-Agent"], "ApiClientRuntime/1.0");
            EXPECT_EQ(headers["Authorization"], "Bearer token");

            dynamic_cast<SimpleResponse&>(res).setStatus(201);
            return true;
        });

    auto request = makeRequest("POST", "/api/v1/orders");
    request.body = R"({"qty":1})";
    request.headers["Authorization"] = "Bearer token";

    auto response = transport_->send(request);

    EXPECT_EQ(response.statusCode, 201);
}

TEST_F(HttpClientTransportTest, Send_RequestHeaderOverridesDefault) {
    transport_->setDefaultHeader("Accept", "application/json");

    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getHeaders()["Accept"], "text/csv");
            dynamic_cast<SimpleResponse&>(res).setStatus(200);
            return true;
        });

    auto request = makeRequest("GET", "/api/v1/reports");
    request.headers["Accept"] = "text/csv";
    transport_->send(request);
}

TEST_F(HttpClientTransportTest, Send_QueryParamsEncodedIntoTarget) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getPath(), "/api/v1/orders?page=2&q=a%20b%26c");
            dynamic_cast<SimpleResponse&>(res).setStatus(200);
            return true;
        });

    auto request = makeRequest("GET", "/api/v1/orders");
    request.params = {{"q", "a b&c"}, {"page", "2"}};
    transport_->send(request);
}

TEST_F(HttpClientTransportTest, Send_ReturnsStatusBodyAndRetryAfter) {
    expectResponse(429, R"({"message":"slow down"})", {{"Retry-After", "30"}});

    auto response = transport_->send(makeRequest("GET", "/api/v1/orders"));

    EXPECT_EQ(response.statusCode, 429);
    EXPECT_EQ(response.body, R"({"message":"slow down"})");
    EXPECT_EQ(response.headers["Retry-After"], "30");
}

TEST_F(HttpClientTransportTest, Send_ErrorStatusIsNotException) {
    expectResponse(500, "");

    auto response = transport_->send(makeRequest("GET", "/api/v1/orders"));

    EXPECT_EQ(response.statusCode, 500);
}

// ============================================================================
// ТЕСТЫ: ошибки транспорта
// ============================================================================

TEST_F(HttpClientTransportTest, SendReturnsFalse_ConnectionError) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).WillOnce(Return(false));

    EXPECT_THROW(transport_->send(makeRequest("GET", "/api/v1/orders")),
                 ports::output::TransportConnectionError);
}

TEST_F(HttpClientTransportTest, ClientThrows_ConnectionError) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse&) -> bool {
            throw std::runtime_error("Connection refused");
        });

    EXPECT_THROW(transport_->send(makeRequest("GET", "/api/v1/orders")),
                 ports::output::TransportConnectionError);
}

TEST_F(HttpClientTransportTest, ClientThrowsTimeout_TimeoutError) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse&) -> bool {
            throw std::runtime_error("Operation timed out");
        });

    EXPECT_THROW(transport_->send(makeRequest("GET", "/api/v1/orders")),
                 ports::output::TransportTimeoutError);
}

TEST_F(HttpClientTransportTest, SlowUpstream_TimeoutError) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse& res) {
            std::this_thread::sleep_for(200ms);
            dynamic_cast<SimpleResponse&>(res).setStatus(200);
            return true;
        });

    auto request = makeRequest("GET", "/api/v1/slow");
    request.timeout = 20ms;

    EXPECT_THROW(transport_->send(request), ports::output::TransportTimeoutError);
    EXPECT_TRUE(transport_->isBusy());
}

TEST_F(HttpClientTransportTest, HangingCall_NextSendOnSessionTimesOutWithoutNewCall) {
    auto hanging = std::make_shared<HangingHttpClient>();
    HttpClientTransport transport(hanging, upstream_);

    auto request = makeRequest("GET", "/api/v1/hang");
    request.timeout = 30ms;

    EXPECT_THROW(transport.send(request), ports::output::TransportTimeoutError);
    EXPECT_THROW(transport.send(request), ports::output::TransportTimeoutError);

    EXPECT_EQ(hanging->calls(), 1);
    EXPECT_EQ(hanging->peak(), 1);

    hanging->openGate();
}

TEST_F(HttpClientTransportTest, FinishedCall_SessionAcceptsNextSend) {
    auto hanging = std::make_shared<HangingHttpClient>();
    HttpClientTransport transport(hanging, upstream_);

    auto request = makeRequest("GET", "/api/v1/hang");
    request.timeout = 30ms;
    EXPECT_THROW(transport.send(request), ports::output::TransportTimeoutError);

    hanging->openGate();

    request.timeout = 1000ms;
    auto response = transport.send(request);

    EXPECT_EQ(response.statusCode, 200);
    EXPECT_EQ(hanging->calls(), 2);
    EXPECT_FALSE(transport.isBusy());
}

TEST_F(HttpClientTransportTest, HangingUpstream_InFlightCallsBoundedByPoolSize) {
    auto hanging = std::make_shared<HangingHttpClient>();
    settings::PoolConfig poolConfig;
    poolConfig.maxSize = 1;
    poolConfig.acquireTimeout = 100ms;

    {
        application::ConnectionPool pool(
            std::make_shared<HttpClientTransportFactory>(hanging), upstream_, poolConfig);

        auto request = makeRequest("GET", "/api/v1/hang");
        request.timeout = 50ms;

        for (int i = 0; i < 8; ++i) {
            auto lease = pool.acquire();
            EXPECT_THROW(lease->send(request), ports::output::TransportTimeoutError);
        }

        EXPECT_EQ(pool.active(), 1u);
        EXPECT_EQ(hanging->peak(), 1);
        EXPECT_EQ(hanging->calls(), 1);

        hanging->openGate();
    }

    // Сессии пула закрыты, зависший вызов завершён
    EXPECT_EQ(hanging->inFlight(), 0);
}

TEST_F(HttpClientTransportTest, ClosedSession_Rejected) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).Times(0);

    transport_->close();

    EXPECT_TRUE(transport_->isClosed());
    EXPECT_THROW(transport_->send(makeRequest("GET", "/api/v1/orders")),
                 ports::output::TransportConnectionError);
}

// ============================================================================
// ТЕСТЫ: утилиты
// ============================================================================

TEST_F(HttpClientTransportTest, UrlEncode_ReservedCharacters) {
    EXPECT_EQ(HttpClientTransport::urlEncode("abc-_.~"), "abc-_.~");
    EXPECT_EQ(HttpClientTransport::urlEncode("a b"), "a%20b");
    EXPECT_EQ(HttpClientTransport::urlEncode("x=1&y/z"), "x%3D1%26y%2Fz");
}

TEST_F(HttpClientTransportTest, BuildTarget_NoParams_PathUnchanged) {
    EXPECT_EQ(HttpClientTransport::buildTarget("/api/v1/orders", {}), "/api/v1/orders");
}

TEST_F(HttpClientTransportTest, Factory_OpensIndependentSessions) {
    HttpClientTransportFactory factory(mockHttpClient_);

    auto first = factory.openSession(upstream_);
    auto second = factory.openSession(upstream_);
    first->setDefaultHeader("X-Test", "1");

    EXPECT_EQ(first->defaultHeaders().size(), 1u);
    EXPECT_TRUE(second->defaultHeaders().empty());
}

// ============================================================================
// ТЕСТЫ: HttpHealthProbe
// ============================================================================

TEST_F(HttpClientTransportTest, HealthProbe_HealthyOn2xx) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "GET");
            EXPECT_EQ(req.getPath(), "/api/v1/health");
            dynamic_cast<SimpleResponse&>(res).setStatus(204);
            return true;
        })
        .WillOnce([](const IRequest&, IResponse& res) {
            dynamic_cast<SimpleResponse&>(res).setStatus(503);
            return true;
        });

    HttpHealthProbe probe(std::make_shared<HttpClientTransportFactory>(mockHttpClient_), upstream_);

    EXPECT_EQ(probe.name(), "api");
    EXPECT_TRUE(probe.probe());
    EXPECT_FALSE(probe.probe());
}
