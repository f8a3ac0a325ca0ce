#pragma once

#include "handoff/core/clock.hpp"
#include "handoff/core/limits.hpp"
#include <map>
#include <optional>
#include <string>
#include <cstddef>
#include <cstdint>

namespace handoff::security {

struct RateLimitEntry {
    std::uint32_t attempts = 0;
    core::Clock::time_point first_attempt;
    core::Clock::time_point last_attempt;
    bool blocked = false;
    std::optional<core::Clock::time_point> blocked_until;
};

// Per-key attempt counting inside a sliding window. Keys whose window and block
// have both run out are swept on every recorded attempt.
class RateLimiter {
public:
    RateLimiter(const core::Clock& clock, std::uint32_t max_attempts,
                core::Clock::duration window, core::Clock::duration block_duration);
    RateLimiter(const core::Clock& clock, const core::SecurityLimits& limits);
    
    bool is_limited(const std::string& key);
    RateLimitEntry record_attempt(const std::string& key);
    void clear(const std::string& key);
    // Returns how many entries were dropped.
    std::size_t sweep_expired();
    
    std::optional<RateLimitEntry> entry(const std::string& key) const;
    std::size_t size() const { return entries_.size(); }

private:
    bool is_expired(const RateLimitEntry& entry, core::Clock::time_point now) const;
    
    const core::Clock& clock_;
    std::uint32_t max_attempts_;
    core::Clock::duration window_;
    core::Clock::duration block_duration_;
    std::map<std::string, RateLimitEntry> entries_;
};

}
