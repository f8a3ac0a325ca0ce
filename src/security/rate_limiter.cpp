#include "handoff/security/rate_limiter.hpp"
#include "handoff/core/logger.hpp"

namespace handoff::security {

RateLimiter::RateLimiter(const core::Clock& clock, std::uint32_t max_attempts,
                         core::Clock::duration window, core::Clock::duration block_duration)
    : clock_(clock)
    , max_attempts_(max_attempts)
    , window_(window)
    , block_duration_(block_duration) {}

RateLimiter::RateLimiter(const core::Clock& clock, const core::SecurityLimits& limits)
    : RateLimiter(clock, limits.max_connection_attempts,
                  limits.connection_attempt_window, limits.rate_limit_block) {}

bool RateLimiter::is_limited(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    
    auto now = clock_.now();
    const auto& entry = it->second;
    
    if (entry.blocked && entry.blocked_until && now < *entry.blocked_until) {
        return true;
    }
    
    if (now - entry.first_attempt > window_) {
        entries_.erase(it);
        return false;
    }
    
    return entry.attempts >= max_attempts_;
}

RateLimitEntry RateLimiter::record_attempt(const std::string& key) {
    sweep_expired();
    auto now = clock_.now();
    auto it = entries_.find(key);
    
    if (it == entries_.end() || now - it->second.first_attempt > window_) {
        RateLimitEntry fresh;
        fresh.attempts = 1;
        fresh.first_attempt = now;
        fresh.last_attempt = now;
        entries_[key] = fresh;
        return fresh;
    }
    
    auto& entry = it->second;
    entry.attempts++;
    entry.last_attempt = now;
    
    if (entry.attempts >= max_attempts_ && !entry.blocked) {
        entry.blocked = true;
        entry.blocked_until = now + block_duration_;
        LOG_WARN("Rate limit reached for {} after {} attempts", key, entry.attempts);
    }
    
    return entry;
}

void RateLimiter::clear(const std::string& key) {
    entries_.erase(key);
}

std::size_t RateLimiter::sweep_expired() {
    auto now = clock_.now();
    auto swept = std::erase_if(entries_, [this, now](const auto& item) {
        return is_expired(item.second, now);
    });
    if (swept > 0) {
        LOG_DEBUG("Dropped {} expired rate limit entries", swept);
    }
    return swept;
}

bool RateLimiter::is_expired(const RateLimitEntry& entry, core::Clock::time_point now) const {
    if (entry.blocked_until && now < *entry.blocked_until) {
        return false;
    }
    return now - entry.first_attempt > window_;
}

std::optional<RateLimitEntry> RateLimiter::entry(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}
