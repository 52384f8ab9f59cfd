#include "http/cancel.hpp"
#include "http/http_error.hpp"
#include "http/rate_limiter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

// ── CancelToken ──────────────────────────────────────────────────────────────

TEST(CancelToken, StartsLive) {
    CancelToken t;
    EXPECT_FALSE(t.cancelled());
    EXPECT_NO_THROW(t.throw_if_cancelled());
}

TEST(CancelToken, CopiesShareState) {
    CancelToken a;
    CancelToken b = a;
    b.cancel();
    EXPECT_TRUE(a.cancelled());
    EXPECT_THROW(a.throw_if_cancelled(), Cancelled);
}

TEST(CancelToken, CancelIsIdempotent) {
    CancelToken t;
    int calls = 0;
    auto sub = t.subscribe([&calls] { ++calls; });
    t.cancel();
    t.cancel();
    EXPECT_EQ(calls, 1);
}

TEST(CancelToken, SleepRunsFullDurationWhenLive) {
    CancelToken t;
    const auto start = Clock::now();
    EXPECT_TRUE(t.sleep_for(50ms));
    EXPECT_GE(Clock::now() - start, 50ms);
}

TEST(CancelToken, SleepWakesEarlyOnCancel) {
    CancelToken t;
    std::thread canceller([t]() mutable {
        std::this_thread::sleep_for(50ms);
        t.cancel();
    });
    const auto start = Clock::now();
    EXPECT_FALSE(t.sleep_for(10s));
    EXPECT_LT(Clock::now() - start, 5s);
    canceller.join();
}

TEST(CancelToken, SubscribeAfterCancelRunsImmediately) {
    CancelToken t;
    t.cancel();
    bool ran = false;
    auto sub = t.subscribe([&ran] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancelToken, DestroyedSubscriptionIsNotCalled) {
    CancelToken t;
    int calls = 0;
    {
        auto sub = t.subscribe([&calls] { ++calls; });
    }
    t.cancel();
    EXPECT_EQ(calls, 0);
}

// ── RateLimiter ──────────────────────────────────────────────────────────────

TEST(RateLimiter, RejectsInvalidSettings) {
    EXPECT_THROW(RateLimiter(0.0, 1), std::invalid_argument);
    EXPECT_THROW(RateLimiter(-1.0, 1), std::invalid_argument);
    EXPECT_THROW(RateLimiter(10.0, 0), std::invalid_argument);
}

TEST(RateLimiter, BurstIsAvailableImmediately) {
    RateLimiter rl(1.0, 5);
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(rl.try_acquire(), std::chrono::nanoseconds::zero()) << "token " << i;

    // Bucket is empty now; next token is about 1s away.
    const auto wait = rl.try_acquire();
    EXPECT_GT(wait, 500ms);
    EXPECT_LE(wait, 1s);
}

TEST(RateLimiter, AcquirePacesAtConfiguredRate) {
    RateLimiter rl(20.0, 1);
    CancelToken cancel;

    const auto start = Clock::now();
    for (int i = 0; i < 5; ++i) rl.acquire(cancel);
    // First token from the bucket, four more at 50ms each.
    EXPECT_GE(Clock::now() - start, 180ms);
}

TEST(RateLimiter, SharedAcrossThreads) {
    RateLimiter rl(40.0, 4);
    CancelToken cancel;
    std::atomic<int> acquired{0};

    const auto start = Clock::now();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                rl.acquire(cancel);
                ++acquired;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(acquired.load(), 20);
    // 20 tokens, 4 from the burst, 16 refilled at 25ms each.
    EXPECT_GE(Clock::now() - start, 350ms);
}

TEST(RateLimiter, AcquireThrowsWhenAlreadyCancelled) {
    RateLimiter rl(10.0, 1);
    CancelToken cancel;
    cancel.cancel();
    EXPECT_THROW(rl.acquire(cancel), Cancelled);
}

TEST(RateLimiter, CancelInterruptsWait) {
    RateLimiter rl(0.1, 1);  // one token per 10s
    CancelToken cancel;
    rl.acquire(cancel);

    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(50ms);
        cancel.cancel();
    });
    const auto start = Clock::now();
    EXPECT_THROW(rl.acquire(cancel), Cancelled);
    EXPECT_LT(Clock::now() - start, 5s);
    canceller.join();
}
