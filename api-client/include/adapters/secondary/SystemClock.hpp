#pragma once

#include "ports/output/IClock.hpp"
#include <thread>

namespace apiclient::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::TimePoint now() const override {
        return domain::Clock::now();
    }

    void sleepFor(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

} // namespace apiclient::adapters::secondary
