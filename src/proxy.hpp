#pragma once
#include "completion.hpp"
#include "config.hpp"
#include "http.hpp"
#include "server.hpp"
#include "tag_scanner.hpp"
#include <string>
#include <vector>

namespace thinkproxy {

// Connection-level headers (RFC 9110 §7.6.1 plus legacy proxy headers).
bool is_hop_by_hop(const std::string& lowercase_name);

// Client headers to forward upstream. Host, framing and hop-by-hop headers
// are always dropped; Content-Type survives only when keep_content_type is
// set (relayed routes). The chat route sets its own Content-Type.
std::vector<Header> filter_request_headers(const std::vector<Header>& headers,
                                           bool keep_content_type);

// Upstream response headers to pass back. Framing is redone by the server,
// so Content-Length and Transfer-Encoding are dropped with the hop-by-hop set.
std::vector<Header> filter_response_headers(const std::vector<Header>& headers);

// Reverse proxy in front of an OpenAI-compatible API. Chat completions get a
// default reasoning_effort and have inline reasoning moved out of "content";
// every other route is relayed untouched.
class ReasoningProxy {
public:
    // http may be null: every request is then answered with 503 before any
    // upstream call. Throws std::invalid_argument for invalid markers.
    ReasoningProxy(Config config, HttpClient* http);

    void handle(const HttpRequest& req, ResponseWriter& out);

    bool is_chat_request(const HttpRequest& req) const;

private:
    void handle_chat(const HttpRequest& req, ResponseWriter& out);
    void chat_whole(const std::string& url, const std::string& body,
                    const std::vector<Header>& headers, ResponseWriter& out);
    void chat_stream(const std::string& url, const std::string& body,
                     const std::vector<Header>& headers, ResponseWriter& out);
    void relay(const HttpRequest& req, ResponseWriter& out);

    Config config_;
    MarkerPair markers_;
    HttpClient* http_;
};

} // namespace thinkproxy
