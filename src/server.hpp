#pragma once
#include "http.hpp"
#include <string>
#include <functional>
#include <list>
#include <memory>
#include <vector>
#include <atomic>
#include <thread>
#include <cstdint>

namespace thinkproxy {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;          // "GET", "POST", ...
    std::string path;            // e.g. "/v1/chat/completions"
    std::string query;           // raw query string without '?', not decoded
    std::vector<Header> headers; // names lowercased, arrival order kept
    std::string body;

    // First header value with the given lowercase name, or "".
    std::string header(const std::string& name) const;
};

// Sink for one response. Either send() once, or begin() followed by any
// number of write() calls and end(). Every call returns false once the client
// has gone away; callers stop producing output at that point.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    // Complete response with Content-Length.
    virtual bool send(int status, const std::vector<Header>& headers,
                      const std::string& body) = 0;

    // Start a streamed (chunked) response.
    virtual bool begin(int status, const std::vector<Header>& headers) = 0;
    virtual bool write(const char* data, size_t len) = 0;
    virtual bool end() = 0;

    // True once a status line has been sent.
    virtual bool started() const = 0;

    bool write(const std::string& data) { return write(data.data(), data.size()); }
};

// Small threaded HTTP/1.1 server. Every accepted connection is served on its
// own thread and closed after one request ("Connection: close").
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest&, ResponseWriter&)>;

    // listen_addr:     "host:port", e.g. "127.0.0.1:8000"
    // max_body:        maximum request body size in bytes; larger bodies get 413
    // max_connections: concurrent connections; the excess gets 503
    HttpServer(std::string listen_addr, uint32_t max_body,
               uint32_t max_connections, Handler handler);
    virtual ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, then wait for in-flight connections to finish.
    void stop();

    size_t active_connections() const { return active_.load(); }

protected:
    // Runs one connection on a new thread. Throws std::system_error when
    // the thread cannot be created.
    virtual std::thread spawn_worker(std::function<void()> job);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void serve(int client_fd) const;
    void reap_workers(bool wait_all);
    void close_fds();

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    max_connections_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool>   running_{false};
    std::atomic<size_t> active_{0};
    std::thread thread_;
    std::list<Worker> workers_; // touched by the accept thread only, then by stop()
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse the request line and headers (text before the blank line).
// Returns false on a malformed request line.
bool parse_request_head(const std::string& head, HttpRequest& req);

// Standard reason phrase, "Unknown" for unlisted codes.
const char* reason_phrase(int status);

// False for statuses that never carry a body or framing (1xx, 204, 304).
bool status_has_body(int status);

} // namespace thinkproxy
