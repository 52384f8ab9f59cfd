#pragma once

#include "cancel.hpp"
#include "http_sender.hpp"
#include "http_types.hpp"
#include "rate_limiter.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

struct TransportOptions {
    std::string               base_url;
    std::string               token;                    // bearer token
    std::chrono::milliseconds timeout{30000};           // per attempt
    int                       max_attempts    = 3;      // first try + 429 retries
    std::chrono::milliseconds initial_backoff{1000};    // doubles after each 429
    double                    rate_per_sec    = 10.0;
    size_t                    burst           = 20;
};

// Issues API requests with bearer auth, a shared token-bucket rate limit,
// a per-attempt timeout and exponential backoff on HTTP 429.
//
// execute() returns the raw response body of a 2xx answer. It throws:
//   RateLimited       429 on every attempt
//   ApiError          any other status >= 400 (no retry)
//   TransportTimeout  an attempt exceeded the timeout (no retry)
//   Cancelled         `cancel` fired while waiting or sending
//   TransportError    other network failures (no retry)
//
// The instance owns its rate limiter; every component issuing requests for
// the same client shares it through a reference to this transport.
class RequestTransport {
public:
    RequestTransport(TransportOptions opts, std::unique_ptr<HttpSender> sender);

    RequestTransport(const RequestTransport&) = delete;
    RequestTransport& operator=(const RequestTransport&) = delete;

    std::string execute(HttpMethod method, const std::string& path,
                        const std::string* body, const CancelToken& cancel);

    std::string execute(HttpMethod method, const std::string& path,
                        const CancelToken& cancel) {
        return execute(method, path, nullptr, cancel);
    }

    // Pure functions exposed for unit testing.
    static HttpRequest buildRequest(const TransportOptions& opts, HttpMethod method,
                                    const std::string& path, const std::string* body);
    // Delay to wait after the given zero-based failed attempt: initial << attempt.
    static std::chrono::milliseconds backoffDelay(std::chrono::milliseconds initial,
                                                  int attempt);

private:
    TransportOptions            opts_;
    std::unique_ptr<HttpSender> sender_;
    RateLimiter                 limiter_;
};

// Percent-encode `s` for use inside a URL query component.
std::string url_escape(const std::string& s);
