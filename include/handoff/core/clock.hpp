#pragma once

#include <chrono>
#include <cstdint>

namespace handoff::core {

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;
    
    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

// Deterministic clock for tests; only moves when advanced.
class ManualClock : public Clock {
public:
    ManualClock() : now_(std::chrono::steady_clock::now()) {}
    
    time_point now() const override { return now_; }
    
    void advance(duration delta) { now_ += delta; }
    void set(time_point when) { now_ = when; }

private:
    time_point now_;
};

// Wall-clock milliseconds since the Unix epoch, used for wire timestamps.
std::uint64_t unix_time_ms();

}
