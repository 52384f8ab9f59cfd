#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Base of every failure raised below the drive API layer. Plain network
// failures (DNS, refused, reset) are thrown as TransportError itself.
struct TransportError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A single attempt exceeded its per-request deadline.
struct TransportTimeout : TransportError {
    using TransportError::TransportError;
};

// The server kept answering 429 after the retry budget was spent.
struct RateLimited : TransportError {
    int attempts;

    explicit RateLimited(int n)
        : TransportError("API rate limited (429) after " + std::to_string(n) + " retries"),
          attempts(n) {}
};

// Non-429 error status, or a 2xx envelope whose result is not "success".
// Callers can catch ApiError to inspect the status and the raw body.
struct ApiError : TransportError {
    long        status;
    std::string body;

    ApiError(long s, std::string b)
        : TransportError("API error (" + std::to_string(s) + "): " + b),
          status(s), body(std::move(b)) {}
};

// The response body did not match the expected schema.
struct DecodeError : TransportError {
    using TransportError::TransportError;
};

// The caller raised the shared cancellation signal.
struct Cancelled : TransportError {
    Cancelled() : TransportError("operation cancelled") {}
};
