#include "server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace thinkproxy {

std::string HttpRequest::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return {};
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

bool status_has_body(int status) {
    return status >= 200 && status != 204 && status != 304;
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
        return false;
    try {
        int p = std::stoi(digits);
        if (p <= 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── Request parsing ───────────────────────────────────────────────────────────

bool parse_request_head(const std::string& head, HttpRequest& req) {
    auto rl_end = head.find("\r\n");
    if (rl_end == std::string::npos) rl_end = head.size();

    {
        std::istringstream ss(head.substr(0, rl_end));
        std::string target, ver;
        if (!(ss >> req.method >> target >> ver)) return false;
        if (ver.rfind("HTTP/", 0) != 0 || target.empty()) return false;
        auto q = target.find('?');
        if (q != std::string::npos) {
            req.path  = target.substr(0, q);
            req.query = target.substr(q + 1);
        } else {
            req.path = target;
        }
    }

    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string hline = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers.emplace_back(to_lower(trim(hline.substr(0, col))),
                                 trim(hline.substr(col + 1)));
    }
    return true;
}

// ── Socket response writer ───────────────────────────────────────────────────

namespace {

class SocketResponseWriter : public ResponseWriter {
public:
    using ResponseWriter::write;

    SocketResponseWriter(int fd, bool head_only) : fd_(fd), head_only_(head_only) {}

    bool send(int status, const std::vector<Header>& headers,
              const std::string& body) override {
        if (started_) return false;
        started_ = true;
        std::string resp = status_and_headers(status, headers);
        bool has_body = status_has_body(status);
        if (has_body) resp += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        resp += "Connection: close\r\n\r\n";
        if (has_body && !head_only_) resp += body;
        return send_all(resp);
    }

    bool begin(int status, const std::vector<Header>& headers) override {
        if (started_) return false;
        started_ = true;
        chunked_ = true;
        std::string resp = status_and_headers(status, headers);
        resp += "Transfer-Encoding: chunked\r\n"
                "Connection: close\r\n\r\n";
        return send_all(resp);
    }

    bool write(const char* data, size_t len) override {
        if (!chunked_) return false;
        if (len == 0 || head_only_) return !failed_;
        char size_line[32];
        std::snprintf(size_line, sizeof(size_line), "%zx\r\n", len);
        std::string frame = size_line;
        frame.append(data, len);
        frame += "\r\n";
        return send_all(frame);
    }

    bool end() override {
        if (!chunked_) return false;
        chunked_ = false;
        if (head_only_) return !failed_;
        return send_all("0\r\n\r\n");
    }

    bool started() const override { return started_; }

private:
    static std::string status_and_headers(int status, const std::vector<Header>& headers) {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " +
                          reason_phrase(status) + "\r\n";
        for (const auto& h : headers) {
            out += h.first + ": " + h.second + "\r\n";
        }
        return out;
    }

    bool send_all(const std::string& data) {
        if (failed_) return false;
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n = ::send(fd_, p, left, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                failed_ = true;
                return false;
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

    int  fd_;
    bool head_only_;
    bool started_ = false;
    bool chunked_ = false;
    bool failed_  = false;
};

void send_plain(int fd, int status, const std::string& body) {
    SocketResponseWriter out(fd, false);
    out.send(status, {{"Content-Type", "text/plain"}}, body);
}

} // namespace

// ── HttpServer ───────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr,
                       uint32_t max_body,
                       uint32_t max_connections,
                       Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , max_connections_(max_connections)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::close_fds() {
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        close_fds();
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        close_fds();
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    if (::listen(server_fd_, 128) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_fds();
        return false;
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0)
        std::cerr << "[server] Failed to signal shutdown: " << std::strerror(errno) << "\n";
    if (thread_.joinable()) thread_.join();
    reap_workers(true);
    close_fds();
}

void HttpServer::reap_workers(bool wait_all) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (wait_all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        reap_workers(false);

        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval rtv{10, 0};  // 10s recv timeout while reading the request
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &rtv, sizeof(rtv));
        struct timeval stv{30, 0};  // a client that stops reading is dropped
        ::setsockopt(cfd, SOL_SOCKET, SO_SNDTIMEO, &stv, sizeof(stv));

        if (active_.load() >= max_connections_) {
            std::cerr << "[server] Connection limit (" << max_connections_
                      << ") reached, rejecting\n";
            send_plain(cfd, 503, "Too many connections");
            ::close(cfd);
            continue;
        }

        ++active_;
        Worker worker;
        worker.done = std::make_shared<std::atomic<bool>>(false);
        auto done = worker.done;
        try {
            worker.thread = spawn_worker([this, cfd, done]() {
                serve(cfd);
                ::close(cfd);
                --active_;
                done->store(true);
            });
        } catch (const std::system_error& e) {
            std::cerr << "[server] Cannot start connection thread: " << e.what() << "\n";
            send_plain(cfd, 503, "Server busy");
            ::close(cfd);
            --active_;
            continue;
        }
        workers_.push_back(std::move(worker));
    }
}

std::thread HttpServer::spawn_worker(std::function<void()> job) {
    return std::thread(std::move(job));
}

void HttpServer::serve(int fd) const {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_plain(fd, 431, "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string leftover = buf.substr(hdr_end + 4);

    HttpRequest req;
    if (!parse_request_head(buf.substr(0, hdr_end), req)) {
        send_plain(fd, 400, "Malformed request line");
        return;
    }

    if (to_lower(req.header("transfer-encoding")).find("chunked") != std::string::npos) {
        send_plain(fd, 411, "Chunked request bodies are not supported");
        return;
    }

    size_t content_len = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        try {
            content_len = std::stoul(cl);
        } catch (const std::exception&) {
            send_plain(fd, 400, "Invalid Content-Length");
            return;
        }
    }

    if (content_len > max_body_) {
        send_plain(fd, 413, "Payload too large");
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    SocketResponseWriter out(fd, req.method == "HEAD");
    try {
        handler_(req, out);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler failed for " << req.method << " " << req.path
                  << ": " << e.what() << "\n";
        if (!out.started())
            out.send(500, {{"Content-Type", "application/json"}},
                     R"({"error":"Internal server error"})");
    }
}

} // namespace thinkproxy
