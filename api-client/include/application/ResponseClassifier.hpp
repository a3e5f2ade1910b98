#pragma once

#include "domain/ApiError.hpp"
#include "domain/ApiResponse.hpp"
#include "ports/output/ITransport.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace apiclient::application {

/**
 * @brief Преобразование ответа транспорта в ApiResponse или ApiError
 *
 * | Статус        | Результат                                    |
 * |---------------|----------------------------------------------|
 * | 100..399      | ApiResponse(success), пустое тело -> data=nullopt |
 * | 401           | AuthError                                    |
 * | 429           | RateLimitError (Retry-After, по умолчанию 60) |
 * | 5xx           | ServerError                                  |
 * | 404           | NotFoundError (resource.type / resource.id)  |
 * | 422           | ValidationError (errors)                     |
 * | прочие 4xx    | ClientError                                  |
 * | прочее        | ApiError (UNKNOWN)                           |
 *
 * Невалидный JSON в успешном ответе -> ClientError("Invalid JSON response").
 */
class ResponseClassifier {
public:
    static constexpr int DEFAULT_RETRY_AFTER_SECONDS = 60;

    /**
     * @throws domain::ApiError (или наследник) для неуспешных статусов
     */
    static domain::JsonResponse classify(
        const ports::output::TransportResponse& response,
        const domain::Timestamp& timestamp);

    /**
     * @brief Тело ошибки: JSON либо {"message": <текст>}
     */
    static nlohmann::json parseErrorBody(const std::string& body);

    static int parseRetryAfter(const ports::output::TransportResponse& response);

private:
    [[noreturn]] static void throwForStatus(const ports::output::TransportResponse& response);

    static std::optional<std::string> findHeader(
        const domain::Headers& headers, const std::string& name);
};

} // namespace apiclient::application
