#pragma once

#include "cancel.hpp"
#include "http_types.hpp"

// Performs exactly one HTTP exchange. No retries, no rate limiting.
//
// Implementations return the response for any status code received from the
// server and throw for everything else:
//   TransportTimeout  the request exceeded request.timeout
//   Cancelled         `cancel` fired while the request was in flight
//   TransportError    any other network failure
class HttpSender {
public:
    virtual ~HttpSender() = default;
    virtual HttpResponse send(const HttpRequest& request, const CancelToken& cancel) = 0;
};

// libcurl-backed sender. Each send() uses its own easy handle, so one
// instance can be shared by concurrent callers.
class CurlSender : public HttpSender {
public:
    CurlSender();
    ~CurlSender() override;

    CurlSender(const CurlSender&) = delete;
    CurlSender& operator=(const CurlSender&) = delete;

    HttpResponse send(const HttpRequest& request, const CancelToken& cancel) override;
};
