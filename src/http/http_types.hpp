#pragma once

#include <chrono>
#include <string>
#include <vector>

// HTTP status codes the transport treats specially.
static constexpr long HTTP_BAD_REQUEST       = 400;
static constexpr long HTTP_TOO_MANY_REQUESTS = 429;

enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE,
};

inline const char* method_name(HttpMethod m) {
    switch (m) {
        case HttpMethod::GET:    return "GET";
        case HttpMethod::POST:   return "POST";
        case HttpMethod::PUT:    return "PUT";
        case HttpMethod::PATCH:  return "PATCH";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

// One fully-formed HTTP request: absolute URL, header lines ("Name: value")
// and an optional body. Built once per execute() and resent on every retry.
struct HttpRequest {
    HttpMethod                method = HttpMethod::GET;
    std::string               url;
    std::vector<std::string>  headers;
    std::string               body;
    bool                      has_body = false;
    std::chrono::milliseconds timeout{30000};
};

// Raw response of a single attempt. The body is never decoded here.
struct HttpResponse {
    long        status = 0;
    std::string body;
};
