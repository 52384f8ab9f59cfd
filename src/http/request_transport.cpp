#include "request_transport.hpp"
#include "http_error.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

// ── Construction ─────────────────────────────────────────────────────────────

RequestTransport::RequestTransport(TransportOptions opts, std::unique_ptr<HttpSender> sender)
    : opts_(std::move(opts)),
      sender_(std::move(sender)),
      limiter_(opts_.rate_per_sec, opts_.burst) {
    if (!sender_)
        throw std::invalid_argument("RequestTransport: null sender");
    if (opts_.max_attempts < 1)
        throw std::invalid_argument("RequestTransport: max_attempts must be >= 1");
}

// ── Pure helpers (also used by unit tests) ───────────────────────────────────

HttpRequest RequestTransport::buildRequest(const TransportOptions& opts, HttpMethod method,
                                           const std::string& path, const std::string* body) {
    HttpRequest req;
    req.method  = method;
    req.url     = opts.base_url + path;
    req.timeout = opts.timeout;
    req.headers.push_back("Authorization: Bearer " + opts.token);
    req.headers.push_back("Content-Type: application/json");
    if (body) {
        req.body     = *body;
        req.has_body = true;
    }
    return req;
}

std::chrono::milliseconds RequestTransport::backoffDelay(std::chrono::milliseconds initial,
                                                         int attempt) {
    return initial * (1LL << attempt);  // 1s, 2s, 4s, ...
}

std::string url_escape(const std::string& s) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

// ── Public call ──────────────────────────────────────────────────────────────

std::string RequestTransport::execute(HttpMethod method, const std::string& path,
                                      const std::string* body, const CancelToken& cancel) {
    // Built once so a retried request resends the exact same body.
    const HttpRequest req = buildRequest(opts_, method, path, body);
    const char* mname = method_name(method);

    for (int attempt = 0; attempt < opts_.max_attempts; ++attempt) {
        spdlog::debug("waiting for rate limiter method={} path={}", mname, path);
        limiter_.acquire(cancel);
        spdlog::debug("sending request method={} path={} attempt={}", mname, path, attempt + 1);

        HttpResponse resp = sender_->send(req, cancel);
        cancel.throw_if_cancelled();

        if (resp.status == HTTP_TOO_MANY_REQUESTS) {
            if (attempt + 1 < opts_.max_attempts) {
                const auto delay = backoffDelay(opts_.initial_backoff, attempt);
                spdlog::debug("rate limited method={} path={} backoff_ms={}",
                              mname, path, delay.count());
                if (!cancel.sleep_for(delay)) throw Cancelled();
                continue;
            }
            throw RateLimited(opts_.max_attempts);
        }

        if (resp.status >= HTTP_BAD_REQUEST)
            throw ApiError(resp.status, std::move(resp.body));

        return std::move(resp.body);
    }

    throw RateLimited(opts_.max_attempts);
}
