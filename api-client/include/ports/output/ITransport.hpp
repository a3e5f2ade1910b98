#pragma once

#include "domain/ApiRequest.hpp"
#include "settings/ApiClientConfig.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace apiclient::ports::output {

/**
 * @brief Запрос на уровне транспорта
 *
 * path уже содержит basePath upstream, body - сериализованный JSON.
 */
struct TransportRequest {
    std::string method;
    std::string path;
    domain::Headers headers;
    std::string body;
    domain::Params params;
    std::chrono::milliseconds timeout{30000};
};

struct TransportResponse {
    int statusCode = 0;
    domain::Headers headers;
    std::string body;
};

/**
 * @brief Таймаут соединения/ответа
 */
class TransportTimeoutError : public std::runtime_error {
public:
    explicit TransportTimeoutError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Соединение отклонено или сброшено
 */
class TransportConnectionError : public std::runtime_error {
public:
    explicit TransportConnectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Переиспользуемая транспортная сессия
 *
 * Сессия хранит заголовки по умолчанию (Content-Type, Accept, User-Agent).
 * send() бросает TransportTimeoutError / TransportConnectionError,
 * любой HTTP статус возвращается как TransportResponse.
 */
class ITransportSession {
public:
    virtual ~ITransportSession() = default;

    virtual TransportResponse send(const TransportRequest& request) = 0;

    virtual void setDefaultHeader(const std::string& name, const std::string& value) = 0;

    virtual domain::Headers defaultHeaders() const = 0;

    virtual void close() = 0;
};

class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    virtual std::unique_ptr<ITransportSession> openSession(const settings::UpstreamConfig& upstream) = 0;
};

} // namespace apiclient::ports::output
