#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace thinkproxy {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;        // 0 = no response (connect, TLS or protocol failure)
    std::vector<Header> headers; // names lowercased, values as received
    std::string body;            // empty for streamed requests
    bool complete = false;       // body was read to its end

    // First header value with the given lowercase name, or "".
    std::string header(const std::string& name) const;
};

// Called once the status line and headers are in. Return false to abort
// before any body is read.
using ResponseHeadCallback =
    std::function<bool(long status, const std::vector<Header>& headers)>;

// Raw-chunk streaming callback: receives raw (de-chunked) body bytes.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Buffer the whole response body.
    virtual HttpResponse request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds = 300) = 0;

    // Deliver the response head, then the body as it arrives. timeout_seconds
    // bounds the connect and every wait for the next bytes, not the whole
    // transfer.
    virtual HttpResponse stream_request(const std::string& method,
                                        const std::string& url,
                                        const std::string& body,
                                        const std::vector<Header>& headers,
                                        ResponseHeadCallback on_head,
                                        RawChunkCallback on_chunk,
                                        long timeout_seconds = 300) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt picks the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 300) override;

    HttpResponse stream_request(const std::string& method,
                                const std::string& url,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                ResponseHeadCallback on_head,
                                RawChunkCallback on_chunk,
                                long timeout_seconds = 300) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// macOS and others: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 300) override;

    HttpResponse stream_request(const std::string& method,
                                const std::string& url,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                ResponseHeadCallback on_head,
                                RawChunkCallback on_chunk,
                                long timeout_seconds = 300) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// One-shot request with a buffered body
HttpResponse http_request(const std::string& method,
                          const std::string& url,
                          const std::string& body,
                          const std::vector<Header>& headers,
                          long timeout_seconds = 300);

// Request with raw-chunk streaming (no SSE parsing; caller parses)
HttpResponse http_stream_request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 ResponseHeadCallback on_head,
                                 RawChunkCallback on_chunk,
                                 long timeout_seconds = 300);

// Methods that carry a request body and need Content-Length even when empty.
bool method_has_body(const std::string& method);

} // namespace thinkproxy
