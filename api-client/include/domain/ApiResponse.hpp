#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace apiclient::domain {

/**
 * @brief Нормализованный ответ upstream
 *
 * Создаётся один раз на вызов и больше не меняется.
 * data == nullopt для успешного пустого тела.
 */
template <typename T = nlohmann::json>
class ApiResponse {
public:
    ApiResponse(
        bool success,
        std::optional<T> data,
        std::optional<std::string> error,
        std::optional<int> statusCode,
        bool cached,
        Timestamp timestamp
    ) : success_(success)
      , data_(std::move(data))
      , error_(std::move(error))
      , statusCode_(statusCode)
      , cached_(cached)
      , timestamp_(timestamp)
    {}

    static ApiResponse ok(std::optional<T> data, int statusCode, Timestamp timestamp) {
        return ApiResponse(true, std::move(data), std::nullopt, statusCode, false, timestamp);
    }

    static ApiResponse fromCache(T data, Timestamp timestamp) {
        return ApiResponse(true, std::move(data), std::nullopt, std::nullopt, true, timestamp);
    }

    bool success() const { return success_; }
    const std::optional<T>& data() const { return data_; }
    const std::optional<std::string>& error() const { return error_; }
    const std::optional<int>& statusCode() const { return statusCode_; }
    bool cached() const { return cached_; }
    const Timestamp& timestamp() const { return timestamp_; }

private:
    bool success_;
    std::optional<T> data_;
    std::optional<std::string> error_;
    std::optional<int> statusCode_;
    bool cached_;
    Timestamp timestamp_;
};

using JsonResponse = ApiResponse<nlohmann::json>;

} // namespace apiclient::domain
