#pragma once

#include "cancel.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>

// Token bucket shared by every request issued through one client.
// Holds up to `burst` tokens and refills at `rate_per_sec` tokens per second.
// Safe for concurrent use; waiting callers are not served in FIFO order.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(double rate_per_sec, size_t burst);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Block until a token is available, then consume it.
    // Throws Cancelled if `cancel` fires while waiting.
    void acquire(const CancelToken& cancel);

    // Take a token if one is available now. Otherwise leave the bucket
    // untouched and return how long until the next token is due.
    // A zero duration means the token was taken.
    std::chrono::nanoseconds try_acquire();

private:
    void refill(Clock::time_point now);

    const double      rate_;
    const size_t      burst_;
    std::mutex        mtx_;
    double            tokens_;
    Clock::time_point last_;
};
