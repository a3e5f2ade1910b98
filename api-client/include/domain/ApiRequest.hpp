#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace apiclient::domain {

using Params = std::map<std::string, std::string>;
using Headers = std::map<std::string, std::string>;

/**
 * @brief Логический запрос вызывающего кода
 *
 * timeout == nullopt -> используется таймаут upstream по умолчанию.
 */
struct ApiRequest {
    std::string method = "GET";
    std::string path;
    std::optional<nlohmann::json> body;
    Params params;
    Headers headers;
    std::optional<std::chrono::milliseconds> timeout;
};

} // namespace apiclient::domain
