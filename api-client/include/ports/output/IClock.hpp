#pragma once

#include "domain/Timestamp.hpp"
#include <chrono>

namespace apiclient::ports::output {

/**
 * @brief Источник времени
 *
 * Все окна, TTL и таймеры circuit breaker считаются через now(),
 * паузы между повторами - через sleepFor(). В тестах подменяется
 * на FakeClock.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::TimePoint now() const = 0;

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

} // namespace apiclient::ports::output
