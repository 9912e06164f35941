#pragma once

#include <chrono>

namespace pqc_bench {

// Time source for the timed-operation driver. Tests substitute a manual clock.
class Clock {
public:
    using Duration = std::chrono::nanoseconds;

    virtual ~Clock() = default;

    // Time since an arbitrary fixed epoch
    virtual Duration Now() = 0;
};

class SteadyClock final : public Clock {
public:
    Duration Now() override {
        return std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now().time_since_epoch());
    }
};

inline double ElapsedMs(Clock::Duration start, Clock::Duration end) {
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace pqc_bench
