#pragma once

#include "ports/output/ITransport.hpp"
#include <gmock/gmock.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace apiclient::tests {

class MockTransportSession : public ports::output::ITransportSession {
public:
    MOCK_METHOD(ports::output::TransportResponse, send, (const ports::output::TransportRequest& request), (override));
    MOCK_METHOD(void, setDefaultHeader, (const std::string& name, const std::string& value), (override));
    MOCK_METHOD(domain::Headers, defaultHeaders, (), (const, override));
    MOCK_METHOD(void, close, (), (override));
};

class MockTransportFactory : public ports::output::ITransportFactory {
public:
    MOCK_METHOD(std::unique_ptr<ports::output::ITransportSession>, openSession,
                (const settings::UpstreamConfig& upstream), (override));
};

/**
 * @brief Программируемый транспорт для сценарных тестов
 *
 * Все сессии фабрики отвечают через общий responder. Фабрика считает
 * открытые/закрытые сессии и запросы.
 */
class StubTransportFactory : public ports::output::ITransportFactory {
public:
    using Responder = std::function<ports::output::TransportResponse(const ports::output::TransportRequest&)>;

    class Session : public ports::output::ITransportSession {
    public:
        explicit Session(StubTransportFactory* owner) : owner_(owner) {}

        ports::output::TransportResponse send(const ports::output::TransportRequest& request) override {
            return owner_->dispatch(request, headers_);
        }

        void setDefaultHeader(const std::string& name, const std::string& value) override {
            headers_[name] = value;
        }

        domain::Headers defaultHeaders() const override { return headers_; }

        void close() override { ++owner_->closed_; }

    private:
        StubTransportFactory* owner_;
        domain::Headers headers_;
    };

    StubTransportFactory() {
        respondWith(200, R"({"ok":true})");
    }

    std::unique_ptr<ports::output::ITransportSession> openSession(const settings::UpstreamConfig&) override {
        ++opened_;
        return std::make_unique<Session>(this);
    }

    void setResponder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void respondWith(int status, const std::string& body, domain::Headers headers = {}) {
        setResponder([status, body, headers](const ports::output::TransportRequest&) {
            ports::output::TransportResponse response;
            response.statusCode = status;
            response.body = body;
            response.headers = headers;
            return response;
        });
    }

    int opened() const { return opened_.load(); }
    int closed() const { return closed_.load(); }
    int requests() const { return requests_.load(); }

    ports::output::TransportRequest lastRequest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastRequest_;
    }

    domain::Headers lastSessionHeaders() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastSessionHeaders_;
    }

private:
    ports::output::TransportResponse dispatch(
        const ports::output::TransportRequest& request,
        const domain::Headers& sessionHeaders)
    {
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastRequest_ = request;
            lastSessionHeaders_ = sessionHeaders;
            responder = responder_;
        }
        ++requests_;
        return responder(request);
    }

    mutable std::mutex mutex_;
    Responder responder_;
    ports::output::TransportRequest lastRequest_;
    domain::Headers lastSessionHeaders_;
    std::atomic<int> opened_{0};
    std::atomic<int> closed_{0};
    std::atomic<int> requests_{0};
};

} // namespace apiclient::tests
