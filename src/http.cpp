#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace chatrelay {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* clientp,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    if (flag && flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl, const std::atomic<bool>* abort) {
    if (abort) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                         const_cast<std::atomic<bool>*>(abort));
    }
}

struct RawStreamContext {
    RawChunkCallback* callback;
    bool aborted = false;
};

static size_t raw_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<RawStreamContext*>(userdata);
    if (ctx->aborted) return 0;

    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }

    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::stream_post_raw(const std::string& url,
                                              const std::string& body,
                                              const std::vector<Header>& headers,
                                              RawChunkCallback callback,
                                              long timeout_seconds,
                                              const std::atomic<bool>* abort) {
    return http_stream_post_raw(url, body, headers, std::move(callback),
                                timeout_seconds, abort);
}

HttpResponse http_stream_post_raw(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   RawChunkCallback callback,
                                   long timeout_seconds,
                                   const std::atomic<bool>* abort) {
    CurlRequest req;
    if (!req) return {};

    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    apply_abort_hook(req.curl, abort);

    RawStreamContext ctx{&callback};
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, raw_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    // A write-callback or progress abort still leaves the status readable.
    curl_easy_perform(req.curl);
    HttpResponse response;
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace chatrelay
