#include "http_sender.hpp"
#include "http_error.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>

namespace {

std::once_flag g_curl_init;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int check_cancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancelToken*>(clientp);
    return cancel->cancelled() ? 1 : 0;
}

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

}  // anonymous namespace

CurlSender::CurlSender() {
    std::call_once(g_curl_init, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw TransportError("curl_global_init failed");
    });
}

CurlSender::~CurlSender() = default;

HttpResponse CurlSender::send(const HttpRequest& request, const CancelToken& cancel) {
    std::unique_ptr<CURL, EasyDeleter> easy(curl_easy_init());
    if (!easy)
        throw TransportError("curl_easy_init failed");
    CURL* h = easy.get();

    curl_slist* list = nullptr;
    for (const auto& line : request.headers) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            curl_slist_free_all(list);
            throw TransportError("curl_slist_append failed");
        }
        list = next;
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(list);

    HttpResponse response;

    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method_name(request.method));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, check_cancel);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &cancel);
    if (request.method == HttpMethod::GET && !request.has_body) {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    } else if (request.has_body) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    const CURLcode rc = curl_easy_perform(h);
    switch (rc) {
        case CURLE_OK:
            break;
        case CURLE_OPERATION_TIMEDOUT:
            throw TransportTimeout("request timeout after " +
                                   std::to_string(request.timeout.count() / 1000) + "s: " +
                                   method_name(request.method) + " " + request.url);
        case CURLE_ABORTED_BY_CALLBACK:
            throw Cancelled();
        default:
            throw TransportError(std::string("HTTP request error: ") + curl_easy_strerror(rc));
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
