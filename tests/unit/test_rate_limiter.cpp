#include <gtest/gtest.h>
#include "handoff/security/rate_limiter.hpp"

using namespace handoff::security;
using namespace handoff::core;

class RateLimiterTest : public ::testing::Test {
protected:
    ManualClock clock;
    SecurityLimits limits;
};

TEST_F(RateLimiterTest, FourthAttemptInsideWindowIsLimited) {
    RateLimiter limiter(clock, limits);
    
    for (int attempt = 1; attempt <= 3; ++attempt) {
        EXPECT_FALSE(limiter.is_limited("peer-a")) << "attempt " << attempt;
        limiter.record_attempt("peer-a");
        clock.advance(std::chrono::seconds(30));
    }
    
    EXPECT_TRUE(limiter.is_limited("peer-a"));
    EXPECT_FALSE(limiter.is_limited("peer-b"));
}

TEST_F(RateLimiterTest, BlockLastsForBlockDuration) {
    RateLimiter limiter(clock, 3, std::chrono::minutes(5), std::chrono::minutes(5));
    
    for (int i = 0; i < 3; ++i) {
        limiter.record_attempt("peer");
    }
    auto entry = limiter.entry("peer");
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->blocked);
    ASSERT_TRUE(entry->blocked_until.has_value());
    
    clock.advance(std::chrono::minutes(4));
    EXPECT_TRUE(limiter.is_limited("peer"));
    
    clock.advance(std::chrono::minutes(2));
    EXPECT_FALSE(limiter.is_limited("peer"));
    EXPECT_FALSE(limiter.entry("peer").has_value());
}

TEST_F(RateLimiterTest, WindowResetsCount) {
    RateLimiter limiter(clock, limits);
    
    limiter.record_attempt("peer");
    limiter.record_attempt("peer");
    clock.advance(std::chrono::minutes(6));
    
    auto entry = limiter.record_attempt("peer");
    EXPECT_EQ(entry.attempts, 1u);
    EXPECT_FALSE(limiter.is_limited("peer"));
}

TEST_F(RateLimiterTest, ClearForgetsKey) {
    RateLimiter limiter(clock, limits);
    for (int i = 0; i < 3; ++i) {
        limiter.record_attempt("peer");
    }
    ASSERT_TRUE(limiter.is_limited("peer"));
    
    limiter.clear("peer");
    EXPECT_FALSE(limiter.is_limited("peer"));
}

TEST_F(RateLimiterTest, ExpiredKeysAreSweptOnNextAttempt) {
    RateLimiter limiter(clock, 3, std::chrono::minutes(5), std::chrono::minutes(5));
    for (int i = 0; i < 20; ++i) {
        limiter.record_attempt("client-" + std::to_string(i));
    }
    EXPECT_EQ(limiter.size(), 20u);
    
    clock.advance(std::chrono::minutes(6));
    limiter.record_attempt("client-new");
    
    EXPECT_EQ(limiter.size(), 1u);
    EXPECT_FALSE(limiter.entry("client-0").has_value());
    EXPECT_TRUE(limiter.entry("client-new").has_value());
}

TEST_F(RateLimiterTest, SweepKeepsBlockedKeysUntilBlockEnds) {
    RateLimiter limiter(clock, 2, std::chrono::minutes(1), std::chrono::minutes(10));
    limiter.record_attempt("noisy");
    limiter.record_attempt("noisy");
    limiter.record_attempt("quiet");
    
    clock.advance(std::chrono::minutes(2));
    EXPECT_EQ(limiter.sweep_expired(), 1u);
    EXPECT_TRUE(limiter.is_limited("noisy"));
    EXPECT_FALSE(limiter.entry("quiet").has_value());
    
    clock.advance(std::chrono::minutes(9));
    EXPECT_EQ(limiter.sweep_expired(), 1u);
    EXPECT_EQ(limiter.size(), 0u);
}
