#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/Severity.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace apiclient::domain {

/**
 * @brief Диагностическая запись
 *
 * context - JSON объект (endpoint, status_code, error_type, ...).
 * stackSnapshot - стек вызова record_issue на момент записи.
 */
struct Issue {
    TimePoint timestamp;
    std::string category;
    Severity severity = Severity::INFO;
    std::string message;
    nlohmann::json context = nlohmann::json::object();
    std::string stackSnapshot;

    nlohmann::json toJson() const {
        return {
            {"timestamp", Timestamp(timestamp).toString()},
            {"category", category},
            {"severity", toString(severity)},
            {"message", message},
            {"context", context}
        };
    }
};

} // namespace apiclient::domain
