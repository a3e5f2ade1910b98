#pragma once

#include "ports/output/ITransport.hpp"
#include "settings/ApiClientConfig.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace apiclient::adapters::secondary {

/**
 * @brief Транспортная сессия поверх IHttpClient
 *
 * IHttpClient::send() не принимает таймаут, поэтому вызов выполняется
 * в рабочем потоке сессии, а send() ждёт результат не дольше request.timeout.
 *
 * У сессии один рабочий поток и не больше одного вызова IHttpClient
 * в полёте. Если предыдущий вызов не уложился в таймаут и ещё висит,
 * следующий send() ждёт его до своего дедлайна и бросает
 * TransportTimeoutError, новый вызов не запускается. Так число
 * одновременных обращений к upstream ограничено числом сессий пула.
 *
 * Деструктор дожидается текущего вызова IHttpClient.
 */
class HttpClientTransport : public ports::output::ITransportSession {
public:
    HttpClientTransport(std::shared_ptr<IHttpClient> httpClient, settings::UpstreamConfig upstream);

    ~HttpClientTransport() override;

    HttpClientTransport(const HttpClientTransport&) = delete;
    HttpClientTransport& operator=(const HttpClientTransport&) = delete;

    ports::output::TransportResponse send(const ports::output::TransportRequest& request) override;

    void setDefaultHeader(const std::string& name, const std::string& value) override;

    domain::Headers defaultHeaders() const override;

    void close() override;

    bool isClosed() const;

    /**
     * @brief Выполняется ли сейчас вызов IHttpClient
     */
    bool isBusy() const;

    /**
     * @brief path + "?" + параметры в percent-encoding
     */
    static std::string buildTarget(const std::string& path, const domain::Params& params);

    static std::string urlEncode(const std::string& value);

private:
    struct Exchange;

    void workerLoop();

    std::shared_ptr<IHttpClient> httpClient_;
    settings::UpstreamConfig upstream_;

    mutable std::mutex mutex_;
    std::condition_variable work_;
    std::condition_variable idle_;
    domain::Headers defaultHeaders_;
    std::shared_ptr<Exchange> pending_;
    bool busy_ = false;
    bool closed_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

/**
 * @brief Фабрика сессий для ConnectionPool
 */
class HttpClientTransportFactory : public ports::output::ITransportFactory {
public:
    explicit HttpClientTransportFactory(std::shared_ptr<IHttpClient> httpClient)
        : httpClient_(std::move(httpClient))
    {}

    std::unique_ptr<ports::output::ITransportSession> openSession(
        const settings::UpstreamConfig& upstream) override
    {
        return std::make_unique<HttpClientTransport>(httpClient_, upstream);
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
};

} // namespace apiclient::adapters::secondary
