#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace apiclient::domain {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Временная метка в ISO 8601 формате
 *
 * Все компоненты получают время только через IClock, поэтому
 * Timestamp никогда не вызывает system_clock::now() сам.
 */
struct Timestamp {
    TimePoint value{};

    Timestamp() = default;

    explicit Timestamp(TimePoint tp) : value(tp) {}

    /**
     * @brief Преобразовать в ISO 8601 строку (UTC, миллисекунды)
     */
    std::string toString() const {
        auto timeT = Clock::to_time_t(value);
        std::tm tm = *std::gmtime(&timeT);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()).count() % 1000;

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    /**
     * @brief Получить Unix timestamp (секунды с 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()).count();
    }

    /**
     * @brief Unix timestamp с дробной частью
     */
    double toUnixSecondsDouble() const {
        return std::chrono::duration<double>(value.time_since_epoch()).count();
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
};

/**
 * @brief Разница между двумя моментами в секундах (double)
 */
inline double secondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace apiclient::domain
