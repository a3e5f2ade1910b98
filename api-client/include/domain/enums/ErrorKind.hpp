#pragma once

#include <string>
#include <stdexcept>

namespace apiclient::domain {

/**
 * @brief Класс ошибки вызова upstream
 */
enum class ErrorKind {
    UNKNOWN,     ///< Не удалось классифицировать
    NETWORK,     ///< Соединение отклонено/сброшено, пул исчерпан
    TIMEOUT,     ///< Истёк таймаут вызова
    AUTH,        ///< 401
    RATE_LIMIT,  ///< 429 или локальный RateLimiter
    SERVER,      ///< 5xx или открытый circuit breaker
    CLIENT,      ///< Прочие 4xx, невалидный JSON
    VALIDATION,  ///< 422
    NOT_FOUND,   ///< 404
    CACHE        ///< Ошибка кэша
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNKNOWN:    return "unknown_error";
        case ErrorKind::NETWORK:    return "network_error";
        case ErrorKind::TIMEOUT:    return "timeout_error";
        case ErrorKind::AUTH:       return "authentication_error";
        case ErrorKind::RATE_LIMIT: return "rate_limit_error";
        case ErrorKind::SERVER:     return "server_error";
        case ErrorKind::CLIENT:     return "client_error";
        case ErrorKind::VALIDATION: return "validation_error";
        case ErrorKind::NOT_FOUND:  return "not_found_error";
        case ErrorKind::CACHE:      return "cache_error";
    }
    return "unknown_error";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline ErrorKind errorKindFromString(const std::string& str) {
    if (str == "unknown_error")        return ErrorKind::UNKNOWN;
    if (str == "network_error")        return ErrorKind::NETWORK;
    if (str == "timeout_error")        return ErrorKind::TIMEOUT;
    if (str == "authentication_error") return ErrorKind::AUTH;
    if (str == "rate_limit_error")     return ErrorKind::RATE_LIMIT;
    if (str == "server_error")         return ErrorKind::SERVER;
    if (str == "client_error")         return ErrorKind::CLIENT;
    if (str == "validation_error")     return ErrorKind::VALIDATION;
    if (str == "not_found_error")      return ErrorKind::NOT_FOUND;
    if (str == "cache_error")          return ErrorKind::CACHE;
    throw std::invalid_argument("Unknown ErrorKind: " + str);
}

/**
 * @brief Можно ли повторить вызов с этой ошибкой
 */
inline bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::SERVER || kind == ErrorKind::RATE_LIMIT;
}

} // namespace apiclient::domain
