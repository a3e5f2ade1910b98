#include "domain/ApiError.hpp"

namespace apiclient::domain {

nlohmann::json ApiError::toJson() const {
    nlohmann::json j;
    j["error"] = toString(kind_);
    j["type"] = typeName();
    j["message"] = what();
    j["status_code"] = statusCode_ ? nlohmann::json(*statusCode_) : nlohmann::json();
    j["retry_after"] = retryAfter_ ? nlohmann::json(*retryAfter_) : nlohmann::json();
    if (response_) {
        j["response"] = *response_;
    }
    return j;
}

} // namespace apiclient::domain
