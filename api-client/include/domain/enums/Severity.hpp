#pragma once

#include <string>
#include <stdexcept>

namespace apiclient::domain {

/**
 * @brief Важность диагностической записи
 */
enum class Severity {
    INFO,
    WARNING,
    ERROR
};

inline std::string toString(Severity severity) {
    switch (severity) {
        case Severity::INFO:    return "info";
        case Severity::WARNING: return "warning";
        case Severity::ERROR:   return "error";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline Severity severityFromString(const std::string& str) {
    if (str == "info")    return Severity::INFO;
    if (str == "warning") return Severity::WARNING;
    if (str == "error")   return Severity::ERROR;
    throw std::invalid_argument("Unknown Severity: " + str);
}

} // namespace apiclient::domain
