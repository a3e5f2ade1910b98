#pragma once

#include "domain/enums/ErrorKind.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace apiclient::domain {

/**
 * @brief Базовое исключение вызова upstream
 *
 * Несёт класс ошибки, HTTP статус (если был ответ), тело ответа upstream
 * и retryAfter (только для RATE_LIMIT).
 */
class ApiError : public std::runtime_error {
public:
    ApiError(
        const std::string& message,
        ErrorKind kind = ErrorKind::UNKNOWN,
        std::optional<int> statusCode = std::nullopt,
        std::optional<nlohmann::json> response = std::nullopt,
        std::optional<int> retryAfter = std::nullopt
    ) : std::runtime_error(message)
      , kind_(kind)
      , statusCode_(statusCode)
      , response_(std::move(response))
      , retryAfter_(retryAfter)
    {}

    ErrorKind kind() const { return kind_; }
    const std::optional<int>& statusCode() const { return statusCode_; }
    const std::optional<nlohmann::json>& response() const { return response_; }
    const std::optional<int>& retryAfter() const { return retryAfter_; }

    virtual bool isRetryable() const { return domain::isRetryable(kind_); }

    /**
     * @brief Имя класса ошибки для диагностики ("ServerError", ...)
     */
    virtual std::string typeName() const { return "ApiError"; }

    nlohmann::json toJson() const;

private:
    ErrorKind kind_;
    std::optional<int> statusCode_;
    std::optional<nlohmann::json> response_;
    std::optional<int> retryAfter_;
};

class AuthError : public ApiError {
public:
    explicit AuthError(
        const std::string& message,
        std::optional<int> statusCode = 401,
        std::optional<nlohmann::json> response = std::nullopt
    ) : ApiError(message, ErrorKind::AUTH, statusCode, std::move(response)) {}

    std::string typeName() const override { return "AuthError"; }
};

class RateLimitError : public ApiError {
public:
    RateLimitError(
        const std::string& message,
        int retryAfter,
        std::optional<int> statusCode = 429,
        std::optional<nlohmann::json> response = std::nullopt
    ) : ApiError(message, ErrorKind::RATE_LIMIT, statusCode, std::move(response), retryAfter) {}

    std::string typeName() const override { return "RateLimitError"; }
};

class ServerError : public ApiError {
public:
    explicit ServerError(
        const std::string& message,
        std::optional<int> statusCode = std::nullopt,
        std::optional<nlohmann::json> response = std::nullopt
    ) : ApiError(message, ErrorKind::SERVER, statusCode, std::move(response)) {}

    std::string typeName() const override { return "ServerError"; }
};

/**
 * @brief Circuit breaker открыт, вызов не выполнялся (семантика HTTP 503)
 *
 * Класс SERVER, но не повторяется: отказ локальный и должен вернуться сразу.
 */
class CircuitOpenError : public ServerError {
public:
    explicit CircuitOpenError(const std::string& upstream)
        : ServerError(
            "Circuit breaker open for " + upstream,
            503,
            nlohmann::json{{"service", upstream}})
        , upstream_(upstream)
    {}

    const std::string& upstream() const { return upstream_; }

    bool isRetryable() const override { return false; }

    std::string typeName() const override { return "CircuitOpenError"; }

private:
    std::string upstream_;
};

class ClientError : public ApiError {
public:
    explicit ClientError(
        const std::string& message,
        std::optional<int> statusCode = std::nullopt,
        std::optional<nlohmann::json> response = std::nullopt
    ) : ApiError(message, ErrorKind::CLIENT, statusCode, std::move(response)) {}

    std::string typeName() const override { return "ClientError"; }
};

using FieldErrors = std::map<std::string, std::vector<std::string>>;

class ValidationError : public ApiError {
public:
    ValidationError(
        const std::string& message,
        FieldErrors fieldErrors,
        std::optional<int> statusCode = 422
    ) : ApiError(message, ErrorKind::VALIDATION, statusCode,
                 nlohmann::json{{"errors", fieldErrors}})
      , fieldErrors_(std::move(fieldErrors))
    {}

    const FieldErrors& fieldErrors() const { return fieldErrors_; }

    std::string typeName() const override { return "ValidationError"; }

private:
    FieldErrors fieldErrors_;
};

class NotFoundError : public ApiError {
public:
    NotFoundError(
        const std::string& message,
        std::string resourceType,
        std::optional<std::string> resourceId
    ) : ApiError(message, ErrorKind::NOT_FOUND, 404,
                 nlohmann::json{
                     {"resource_type", resourceType},
                     {"resource_id", resourceId ? nlohmann::json(*resourceId) : nlohmann::json()}})
      , resourceType_(std::move(resourceType))
      , resourceId_(std::move(resourceId))
    {}

    const std::string& resourceType() const { return resourceType_; }
    const std::optional<std::string>& resourceId() const { return resourceId_; }

    std::string typeName() const override { return "NotFoundError"; }

private:
    std::string resourceType_;
    std::optional<std::string> resourceId_;
};

class TimeoutError : public ApiError {
public:
    explicit TimeoutError(const std::string& message)
        : ApiError(message, ErrorKind::TIMEOUT) {}

    std::string typeName() const override { return "TimeoutError"; }
};

class NetworkError : public ApiError {
public:
    explicit NetworkError(const std::string& message)
        : ApiError(message, ErrorKind::NETWORK) {}

    std::string typeName() const override { return "NetworkError"; }
};

/**
 * @brief Пул соединений исчерпан за время ожидания
 */
class ConnectionExhaustedError : public NetworkError {
public:
    explicit ConnectionExhaustedError(const std::string& message)
        : NetworkError(message) {}

    std::string typeName() const override { return "ConnectionExhaustedError"; }
};

class CacheError : public ApiError {
public:
    explicit CacheError(const std::string& message)
        : ApiError(message, ErrorKind::CACHE) {}

    std::string typeName() const override { return "CacheError"; }
};

} // namespace apiclient::domain
