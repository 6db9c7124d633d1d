#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace chatrelay {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = connection or protocol failure
    std::string body;
};

// Raw-chunk streaming callback: receives raw bytes from the response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // POST and stream the response body to callback as it arrives.
    // When abort is non-null the transfer stops within ~1s of it becoming true.
    // The returned body is empty; status_code is the response status.
    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         long timeout_seconds = 300,
                                         const std::atomic<bool>* abort = nullptr) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 long timeout_seconds = 300,
                                 const std::atomic<bool>* abort = nullptr) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 long timeout_seconds = 300,
                                 const std::atomic<bool>* abort = nullptr) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// HTTP POST with raw-chunk streaming (no SSE parsing, caller parses)
HttpResponse http_stream_post_raw(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  RawChunkCallback callback,
                                  long timeout_seconds = 300,
                                  const std::atomic<bool>* abort = nullptr);

} // namespace chatrelay
