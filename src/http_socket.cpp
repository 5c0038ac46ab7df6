// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http_curl.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/select.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <stdexcept>

namespace thinkproxy {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("http_socket: invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("http_socket: missing host in URL: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    long     idle_limit = 300; // 1-second slices without data before giving up

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        idle_limit = timeout_secs > 0 ? timeout_secs : 1;

        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return false;

        // Use full timeout for TLS handshake, then switch to 1-second slices
        // so abort-flag checks work during body streaming.
        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return false;
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return false;
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI
            SSL_set1_host(ssl, url.host.c_str());

            if (SSL_connect(ssl) != 1) return false;
        }

        // 1-second slice timeout for body I/O (enables abort-flag polling).
        set_socket_timeout(1);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on unrecoverable error
    // or when idle_limit slices pass without data.
    // EAGAIN (1-second slice expiry) loops back so the caller can check abort.
    ssize_t read_some(char* buf, size_t len) {
        long idle = 0;
        while (true) {
            if (g_socket_abort_flag &&
                g_socket_abort_flag->load(std::memory_order_relaxed))
                return -1;
            if (idle >= idle_limit) return -1;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                    ++idle;
                    continue;
                }
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    ++idle; // 1-second slice expired
                    continue;
                }
                // Peers that close without close_notify: treat as EOF.
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0;
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK) { ++idle; continue; }
                if (errno == EINTR) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                        continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (to_lower(h.first) == "content-length") has_content_length = true;
    }
    if ((!body.empty() || method_has_body(method)) && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

struct ResponseHead {
    long status = 0;
    std::vector<Header> headers;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false when the connection ends before a full line arrives.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

// Parse status line + headers. Interim 1xx responses are skipped.
static bool parse_response_head(Connection& conn, std::string& leftover,
                                ResponseHead& head) {
    while (true) {
        head = ResponseHead{};
        std::string status_line;
        if (!read_line(conn, leftover, status_line) || status_line.empty())
            return false;

        // "HTTP/1.1 200 OK": extract the three-digit code
        size_t sp1 = status_line.find(' ');
        if (sp1 == std::string::npos) return false;
        try { head.status = std::stol(status_line.substr(sp1 + 1, 3)); }
        catch (const std::exception&) { return false; }

        while (true) {
            std::string line;
            if (!read_line(conn, leftover, line)) return false;
            if (line.empty()) break; // blank line → end of headers

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string name  = to_lower(line.substr(0, colon));
            std::string value = line.substr(colon + 1);
            while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
                value.erase(0, 1);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
                value.pop_back();

            if (name == "transfer-encoding") {
                head.is_chunked = to_lower(value).find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                try {
                    head.content_length = std::stoul(value);
                    head.has_length = true;
                } catch (const std::exception&) {
                    head.has_length = false;
                }
            }
            head.headers.emplace_back(std::move(name), std::move(value));
        }

        if (head.status >= 100 && head.status < 200 && head.status != 101)
            continue;
        return true;
    }
}

static bool has_no_body(const std::string& method, long status) {
    return method == "HEAD" || status == 204 || status == 304 ||
           (status >= 100 && status < 200);
}

// Stream body to a RawChunkCallback; dechunks if needed.
// Returns true only if the body was read to its end and every callback
// returned true.
static bool stream_body_raw(Connection& conn, std::string& leftover,
                             const ResponseHead& head,
                             const RawChunkCallback& callback) {
    if (head.is_chunked) {
        for (;;) {
            std::string size_line;
            if (!read_line(conn, leftover, size_line)) return false;
            // Chunk size is hex, may have extensions after ';'
            char* end = nullptr;
            size_t chunk_size = std::strtoul(size_line.c_str(), &end, 16);
            if (end == size_line.c_str()) return false;
            if (chunk_size == 0) {
                // Trailers until blank line
                std::string trailer;
                while (read_line(conn, leftover, trailer) && !trailer.empty()) {}
                return true;
            }

            size_t remaining = chunk_size;
            while (remaining > 0) {
                if (!leftover.empty()) {
                    size_t take = std::min(remaining, leftover.size());
                    if (!callback(leftover.data(), take)) return false;
                    leftover.erase(0, take);
                    remaining -= take;
                    continue;
                }
                char buf[4096];
                ssize_t n = conn.read_some(buf, std::min(remaining, sizeof(buf)));
                if (n <= 0) return false; // connection ended mid-chunk
                if (!callback(buf, static_cast<size_t>(n))) return false;
                remaining -= static_cast<size_t>(n);
            }
            std::string crlf;
            if (!read_line(conn, leftover, crlf)) return false;
        }
    }

    size_t remaining = head.content_length;
    while (!head.has_length || remaining > 0) {
        if (!leftover.empty()) {
            size_t take = head.has_length
                ? std::min(remaining, leftover.size())
                : leftover.size();
            if (!callback(leftover.data(), take)) return false;
            leftover.erase(0, take);
            if (head.has_length) remaining -= take;
            continue;
        }
        size_t want = head.has_length
            ? std::min(remaining, static_cast<size_t>(4096))
            : 4096;
        char buf[4096];
        ssize_t n = conn.read_some(buf, want);
        if (n == 0) return !head.has_length; // read-to-close body ends at EOF
        if (n < 0) return false;
        if (!callback(buf, static_cast<size_t>(n))) return false;
        if (head.has_length) remaining -= static_cast<size_t>(n);
    }
    return true;
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                const ResponseHeadCallback& on_head,
                                const RawChunkCallback& on_chunk,
                                long timeout_secs) {
    ParsedUrl url;
    try { url = parse_url(url_str); } catch (const std::exception&) { return {}; }

    Connection conn;
    if (!conn.connect(url, timeout_secs)) return {};

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    std::string leftover;
    ResponseHead head;
    if (!parse_response_head(conn, leftover, head)) return {};

    HttpResponse resp;
    resp.status_code = head.status;
    resp.headers = head.headers;

    if (on_head && !on_head(resp.status_code, resp.headers)) return resp;

    if (has_no_body(method, head.status)) {
        resp.complete = true;
        return resp;
    }
    resp.complete = stream_body_raw(conn, leftover, head, on_chunk);
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::request(const std::string& method,
                                       const std::string& url,
                                       const std::string& body,
                                       const std::vector<Header>& headers,
                                       long timeout_seconds) {
    return http_request(method, url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::stream_request(const std::string& method,
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
    HttpResponse resp = do_request(method, url, body, headers, nullptr, collect,
                                   timeout_seconds);
    resp.body = std::move(response_body);
    return resp;
}

HttpResponse http_stream_request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 ResponseHeadCallback on_head,
                                 RawChunkCallback on_chunk,
                                 long timeout_seconds) {
    return do_request(method, url, body, headers, on_head, on_chunk, timeout_seconds);
}

} // namespace thinkproxy

#endif // __linux__
