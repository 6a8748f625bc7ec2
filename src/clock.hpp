#pragma once
#include <chrono>
#include <mutex>

namespace modelgate {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Duration = std::chrono::milliseconds;

// Fractional seconds -> Duration (config values are seconds)
inline Duration seconds_to_duration(double secs) {
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(secs));
}

inline double duration_to_seconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

// Injectable time source. Rate limiter, breaker, cache and queue all read
// time through this so tests can drive it by hand.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return SteadyClock::now(); }
};

// Clock that only moves when told to. Thread-safe.
class ManualClock : public Clock {
public:
    ManualClock() : now_(SteadyClock::now()) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(Duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace modelgate
