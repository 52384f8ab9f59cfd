#include "rate_limiter.hpp"
#include "http_error.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

RateLimiter::RateLimiter(double rate_per_sec, size_t burst)
    : rate_(rate_per_sec), burst_(burst),
      tokens_(static_cast<double>(burst)), last_(Clock::now()) {
    if (rate_per_sec <= 0.0)
        throw std::invalid_argument("RateLimiter: rate must be > 0");
    if (burst == 0)
        throw std::invalid_argument("RateLimiter: burst must be > 0");
}

void RateLimiter::refill(Clock::time_point now) {
    const double elapsed = std::chrono::duration<double>(now - last_).count();
    if (elapsed > 0.0) {
        tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed * rate_);
        last_   = now;
    }
}

std::chrono::nanoseconds RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lk(mtx_);
    refill(Clock::now());
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return std::chrono::nanoseconds::zero();
    }
    const double missing = 1.0 - tokens_;
    const auto   wait_ns = static_cast<int64_t>(std::ceil(missing / rate_ * 1e9));
    return std::chrono::nanoseconds(std::max<int64_t>(wait_ns, 1));
}

void RateLimiter::acquire(const CancelToken& cancel) {
    for (;;) {
        cancel.throw_if_cancelled();
        const auto wait = try_acquire();
        if (wait == std::chrono::nanoseconds::zero()) return;
        // Another waiter may grab the refilled token first; loop and retry.
        if (!cancel.sleep_for(wait)) throw Cancelled();
    }
}
