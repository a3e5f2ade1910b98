#include "application/ResponseClassifier.hpp"
#include <algorithm>
#include <cctype>

namespace apiclient::application {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string stringField(const nlohmann::json& j, const char* key, const std::string& fallback) {
    if (j.is_object()) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return fallback;
}

} // namespace

domain::JsonResponse ResponseClassifier::classify(
    const ports::output::TransportResponse& response,
    const domain::Timestamp& timestamp
) {
    if (response.statusCode < 100 || response.statusCode >= 400) {
        throwForStatus(response);
    }

    if (isBlank(response.body)) {
        return domain::JsonResponse::ok(std::nullopt, response.statusCode, timestamp);
    }

    try {
        return domain::JsonResponse::ok(
            nlohmann::json::parse(response.body), response.statusCode, timestamp);
    } catch (const nlohmann::json::parse_error&) {
        throw domain::ClientError("Invalid JSON response", response.statusCode);
    }
}

void ResponseClassifier::throwForStatus(const ports::output::TransportResponse& response) {
    int status = response.statusCode;
    auto errorData = parseErrorBody(response.body);

    if (status == 401) {
        throw domain::AuthError("Authentication failed", status, errorData);
    }
    if (status == 429) {
        throw domain::RateLimitError("Rate limit exceeded", parseRetryAfter(response), status, errorData);
    }
    if (status >= 500 && status < 600) {
        throw domain::ServerError("Server error occurred", status, errorData);
    }
    if (status == 404) {
        std::string resourceType = "unknown";
        std::optional<std::string> resourceId;

        auto resource = errorData.find("resource");
        if (resource != errorData.end() && resource->is_object()) {
            resourceType = stringField(*resource, "type", resourceType);
            auto id = resource->find("id");
            if (id != resource->end() && !id->is_null()) {
                resourceId = id->is_string() ? id->get<std::string>() : id->dump();
            }
        }

        throw domain::NotFoundError(
            stringField(errorData, "message", "Resource not found"), resourceType, resourceId);
    }
    if (status == 422) {
        domain::FieldErrors fieldErrors;
        auto errors = errorData.find("errors");
        if (errors != errorData.end() && errors->is_object()) {
            for (const auto& [field, messages] : errors->items()) {
                auto& list = fieldErrors[field];
                if (messages.is_array()) {
                    for (const auto& m : messages) {
                        list.push_back(m.is_string() ? m.get<std::string>() : m.dump());
                    }
                } else {
                    list.push_back(messages.is_string() ? messages.get<std::string>() : messages.dump());
                }
            }
        }

        throw domain::ValidationError(
            stringField(errorData, "message", "Validation failed"), std::move(fieldErrors), status);
    }
    if (status >= 400 && status < 500) {
        throw domain::ClientError(stringField(errorData, "message", "Request failed"), status, errorData);
    }

    throw domain::ApiError(
        "Unexpected response status " + std::to_string(status),
        domain::ErrorKind::UNKNOWN, status, errorData);
}

nlohmann::json ResponseClassifier::parseErrorBody(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json{{"message", body}};
    }
    return parsed;
}

int ResponseClassifier::parseRetryAfter(const ports::output::TransportResponse& response) {
    auto header = findHeader(response.headers, "Retry-After");
    if (!header) {
        return DEFAULT_RETRY_AFTER_SECONDS;
    }

    try {
        int seconds = std::stoi(*header);
        return seconds > 0 ? seconds : DEFAULT_RETRY_AFTER_SECONDS;
    } catch (const std::logic_error&) {
        // HTTP-date и мусор не поддерживаются
        return DEFAULT_RETRY_AFTER_SECONDS;
    }
}

std::optional<std::string> ResponseClassifier::findHeader(
    const domain::Headers& headers, const std::string& name
) {
    auto wanted = toLower(name);
    for (const auto& [key, value] : headers) {
        if (toLower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace apiclient::application
