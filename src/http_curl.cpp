// HTTP client on libcurl, used on platforms without the socket client
// (macOS). Same interface behaviour as http_socket.cpp.
#ifndef __linux__

#include "http.hpp"
#include "util.hpp"

#include <curl/curl.h>
#include <string>

namespace thinkproxy {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

struct TransferContext {
    const ResponseHeadCallback* on_head = nullptr;
    const RawChunkCallback* on_chunk = nullptr;
    std::vector<Header> headers;
    long status = 0;
    bool head_delivered = false;
    bool aborted = false;
};

// Curl delivers header lines one by one, including those of interim 1xx
// responses; a status line starts a fresh header block.
static size_t header_callback(char* ptr, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::string line(ptr, total);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();

    if (line.rfind("HTTP/", 0) == 0) {
        ctx->headers.clear();
        size_t sp = line.find(' ');
        if (sp != std::string::npos) {
            try { ctx->status = std::stol(line.substr(sp + 1, 3)); }
            catch (const std::exception&) { ctx->status = 0; }
        }
        return total;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) return total;
    std::string name = to_lower(line.substr(0, colon));
    std::string value = line.substr(colon + 1);
    while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
        value.erase(0, 1);
    ctx->headers.emplace_back(std::move(name), std::move(value));
    return total;
}

static bool deliver_head(TransferContext& ctx) {
    if (ctx.head_delivered) return !ctx.aborted;
    ctx.head_delivered = true;
    if (ctx.on_head && *ctx.on_head && !(*ctx.on_head)(ctx.status, ctx.headers))
        ctx.aborted = true;
    return !ctx.aborted;
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->aborted || !deliver_head(*ctx)) return 0;

    if (!(*ctx->on_chunk)(ptr, total)) {
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
    // Curl adds "Expect: 100-continue" for large bodies; upstreams that
    // mishandle it stall the request.
    list = curl_slist_append(list, "Expect:");
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

static void setup_request(CurlRequest& req, const std::string& method,
                           const std::string& url, const std::string& body,
                           const std::vector<Header>& headers, long timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, timeout);
    // Idle timeout: abort when less than 1 byte/s arrives for `timeout` seconds.
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_TIME, timeout);
    // Relay compressed bodies untouched.
    curl_easy_setopt(req.curl, CURLOPT_HTTP_CONTENT_DECODING, 0L);

    if (method == "GET") {
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    } else if (method == "HEAD") {
        curl_easy_setopt(req.curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (!body.empty() || method_has_body(method)) {
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
    apply_abort_hook(req.curl);
}

static HttpResponse perform(CurlRequest& req, TransferContext& ctx) {
    curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);

    HttpResponse response;
    if (ctx.status == 0) return response;
    response.status_code = ctx.status;
    response.headers = ctx.headers;
    if (res == CURLE_OK) {
        // Empty bodies never hit write_callback.
        response.complete = deliver_head(ctx);
    }
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::request(const std::string& method,
                                     const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_request(method, url, body, headers, timeout_seconds);
}

HttpResponse CurlHttpClient::stream_request(const std::string& method,
                                            const std::string& url,
                                            const std::string& body,
                                            const std::vector<Header>& headers,
                                            ResponseHeadCallback on_head,
                                            RawChunkCallback on_chunk,
                                            long timeout_seconds) {
    return http_stream_request(method, url, body, headers, std::move(on_head),
                               std::move(on_chunk), timeout_seconds);
}

HttpResponse http_request(const std::string& method,
                          const std::string& url,
                          const std::string& body,
                          const std::vector<Header>& headers,
                          long timeout_seconds) {
    std::string response_body;
    RawChunkCallback collect = [&response_body](const char* data, size_t len) {
        response_body.append(data, len);
        return true;
    };
    HttpResponse response = http_stream_request(method, url, body, headers, nullptr,
                                                collect, timeout_seconds);
    response.body = std::move(response_body);
    return response;
}

HttpResponse http_stream_request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 ResponseHeadCallback on_head,
                                 RawChunkCallback on_chunk,
                                 long timeout_seconds) {
    CurlRequest req;
    if (!req) return {};
    setup_request(req, method, url, body, headers, timeout_seconds);
    TransferContext ctx;
    ctx.on_head = &on_head;
    ctx.on_chunk = &on_chunk;
    return perform(req, ctx);
}

} // namespace thinkproxy

#endif // !__linux__
