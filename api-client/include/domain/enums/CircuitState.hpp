#pragma once

#include <string>

namespace apiclient::domain {

/**
 * @brief Состояние circuit breaker
 */
enum class CircuitState {
    CLOSED,     ///< Нормальная работа
    OPEN,       ///< Upstream падает, запросы отклоняются
    HALF_OPEN   ///< Пробные запросы после recovery timeout
};

inline std::string toString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

} // namespace apiclient::domain
