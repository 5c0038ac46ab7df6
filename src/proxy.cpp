#include "proxy.hpp"
#include "sse.hpp"
#include "stream_session.hpp"
#include "transform.hpp"
#include "util.hpp"

#include <iostream>
#include <utility>

namespace thinkproxy {

// ── Header filtering ─────────────────────────────────────────────────────────

bool is_hop_by_hop(const std::string& name) {
    return name == "connection" || name == "keep-alive" ||
           name == "proxy-authenticate" || name == "proxy-authorization" ||
           name == "proxy-connection" || name == "te" || name == "trailer" ||
           name == "trailers" || name == "transfer-encoding" || name == "upgrade";
}

std::vector<Header> filter_request_headers(const std::vector<Header>& headers,
                                           bool keep_content_type) {
    std::vector<Header> out;
    out.reserve(headers.size());
    for (const auto& h : headers) {
        std::string name = to_lower(h.first);
        if (is_hop_by_hop(name) || name == "host" || name == "content-length") continue;
        if (name == "content-type" && !keep_content_type) continue;
        out.push_back(h);
    }
    return out;
}

std::vector<Header> filter_response_headers(const std::vector<Header>& headers) {
    std::vector<Header> out;
    out.reserve(headers.size());
    for (const auto& h : headers) {
        std::string name = to_lower(h.first);
        if (is_hop_by_hop(name) || name == "content-length") continue;
        out.push_back(h);
    }
    return out;
}

// ── Helpers ──────────────────────────────────────────────────────────────────

static bool is_success(long status) {
    return status >= 200 && status < 300;
}

static std::string header_value(const std::vector<Header>& headers,
                                const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return {};
}

static void send_json(ResponseWriter& out, int status, const Json& body) {
    out.send(status, {{"Content-Type", "application/json"}}, dump_payload(body));
}

static void send_bad_gateway(ResponseWriter& out) {
    send_json(out, 502, {{"error", "Bad gateway"}});
}

// Upstream errors go back with the same status and body.
static void relay_error(long status, const std::vector<Header>& headers,
                        const std::string& body, ResponseWriter& out) {
    int code = static_cast<int>(status);
    std::cerr << "[proxy] Upstream returned " << status << "\n";
    if (body.empty()) {
        send_json(out, code, {{"detail", reason_phrase(code)}});
        return;
    }
    std::string content_type = header_value(headers, "content-type");
    if (content_type.empty()) content_type = "application/json";
    out.send(code, {{"Content-Type", content_type}}, body);
}

// ── ReasoningProxy ───────────────────────────────────────────────────────────

ReasoningProxy::ReasoningProxy(Config config, HttpClient* http)
    : config_(std::move(config))
    , markers_(config_.reasoning.start_marker, config_.reasoning.end_marker)
    , http_(http)
{}

bool ReasoningProxy::is_chat_request(const HttpRequest& req) const {
    return req.method == "POST" && req.path == config_.chat_path;
}

void ReasoningProxy::handle(const HttpRequest& req, ResponseWriter& out) {
    if (!http_) {
        send_json(out, 503, {{"error", "Service unavailable"}});
        return;
    }

    try {
        if (is_chat_request(req))
            handle_chat(req, out);
        else
            relay(req, out);
    } catch (const std::exception& e) {
        std::cerr << "[proxy] Unexpected error on " << req.method << " " << req.path
                  << ": " << e.what() << "\n";
        if (!out.started())
            send_json(out, 500, {{"error", "Internal server error"}});
        else
            out.end();
    }
}

void ReasoningProxy::handle_chat(const HttpRequest& req, ResponseWriter& out) {
    Json body = Json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        send_json(out, 400, {{"error", "Request body must be a JSON object"}});
        return;
    }

    if (!config_.reasoning.effort.empty() && !body.contains("reasoning_effort"))
        body["reasoning_effort"] = config_.reasoning.effort;

    bool stream = body.contains("stream") && body["stream"].is_boolean() &&
                  body["stream"].get<bool>();

    // The response body is parsed here, so ask for it uncompressed.
    std::vector<Header> headers;
    for (auto& h : filter_request_headers(req.headers, false)) {
        if (to_lower(h.first) != "accept-encoding") headers.push_back(std::move(h));
    }
    headers.emplace_back("Content-Type", "application/json");
    headers.emplace_back("Accept-Encoding", "identity");

    std::string url = config_.upstream_for(req.path, req.query);
    std::cerr << "[proxy] " << req.method << " " << req.path
              << (stream ? " (stream)" : "") << "\n";

    if (stream)
        chat_stream(url, dump_payload(body), headers, out);
    else
        chat_whole(url, dump_payload(body), headers, out);
}

void ReasoningProxy::chat_whole(const std::string& url, const std::string& body,
                                const std::vector<Header>& headers,
                                ResponseWriter& out) {
    HttpResponse resp = http_->request("POST", url, body, headers,
                                       config_.timeout_seconds);
    if (resp.status_code == 0) {
        std::cerr << "[proxy] Upstream unreachable: " << url << "\n";
        send_bad_gateway(out);
        return;
    }
    if (!is_success(resp.status_code)) {
        relay_error(resp.status_code, resp.headers, resp.body, out);
        return;
    }
    if (!resp.complete) {
        std::cerr << "[proxy] Upstream response truncated after "
                  << resp.body.size() << " bytes\n";
        send_bad_gateway(out);
        return;
    }

    out.send(static_cast<int>(resp.status_code), {{"Content-Type", "application/json"}},
             transform_completion_body(resp.body, markers_, config_.reasoning.field));
}

void ReasoningProxy::chat_stream(const std::string& url, const std::string& body,
                                 const std::vector<Header>& headers,
                                 ResponseWriter& out) {
    enum class Mode { Pending, Events, Whole, Error };

    StreamSession session(markers_, config_.reasoning.field);
    SSEParser parser;
    Mode mode = Mode::Pending;
    long status = 0;
    std::vector<Header> upstream_headers;
    std::string buffered;
    bool done = false;
    bool client_gone = false;

    auto emit = [&](const std::string& frame) {
        if (!out.write(frame)) client_gone = true;
        return !client_gone;
    };

    SSECallback on_event = [&](const SSEEvent& ev) -> bool {
        if (is_done_sentinel(ev.data)) {
            if (auto tail = session.finish()) emit(encode_data(*tail));
            emit(encode_event(ev));
            done = true;
            return false;
        }
        auto transformed = session.transform(ev.data);
        if (!transformed) return true;
        SSEEvent rewritten = ev;
        rewritten.data = std::move(*transformed);
        return emit(encode_event(rewritten));
    };

    ResponseHeadCallback on_head = [&](long st, const std::vector<Header>& hs) {
        status = st;
        upstream_headers = hs;
        if (!is_success(st)) {
            mode = Mode::Error;
            return true;
        }
        std::string content_type = header_value(hs, "content-type");
        if (!content_type.empty() &&
            to_lower(content_type).find("text/event-stream") == std::string::npos) {
            // Upstream ignored "stream": true and sent a whole completion.
            mode = Mode::Whole;
            return true;
        }
        mode = Mode::Events;
        if (content_type.empty()) content_type = "text/event-stream";
        if (!out.begin(static_cast<int>(st), {{"Content-Type", content_type},
                                              {"Cache-Control", "no-cache"}})) {
            client_gone = true;
            return false;
        }
        return true;
    };

    RawChunkCallback on_chunk = [&](const char* data, size_t len) {
        if (mode != Mode::Events) {
            buffered.append(data, len);
            return true;
        }
        return parser.feed(data, len, on_event);
    };

    HttpResponse resp = http_->stream_request("POST", url, body, headers, on_head,
                                              on_chunk, config_.timeout_seconds);

    switch (mode) {
    case Mode::Pending:
        std::cerr << "[proxy] Upstream unreachable: " << url << "\n";
        send_bad_gateway(out);
        return;

    case Mode::Error:
        relay_error(status, upstream_headers, buffered, out);
        return;

    case Mode::Whole:
        if (!resp.complete) {
            send_bad_gateway(out);
            return;
        }
        out.send(static_cast<int>(status), {{"Content-Type", "application/json"}},
                 transform_completion_body(buffered, markers_, config_.reasoning.field));
        return;

    case Mode::Events:
        break;
    }

    if (!done && !client_gone) {
        if (resp.complete) {
            // Upstream closed without a sentinel: deliver a trailing frame and
            // resolve held bytes as for a normal end.
            parser.finish(on_event);
            if (!done) {
                if (auto tail = session.finish()) emit(encode_data(*tail));
            }
        } else {
            std::cerr << "[proxy] Upstream stream ended early after "
                      << session.events_seen() << " events\n";
            session.abort();
        }
    } else if (client_gone) {
        std::cerr << "[proxy] Client disconnected after " << session.events_seen()
                  << " events\n";
        session.abort();
    }

    if (session.frames_dropped() > 0)
        std::cerr << "[proxy] Dropped " << session.frames_dropped()
                  << " malformed frames\n";
    out.end();
}

void ReasoningProxy::relay(const HttpRequest& req, ResponseWriter& out) {
    std::string url = config_.upstream_for(req.path, req.query);
    std::vector<Header> headers = filter_request_headers(req.headers, true);

    bool started = false;
    bool bodiless = false;
    ResponseHeadCallback on_head = [&](long st, const std::vector<Header>& hs) {
        started = true;
        int status = static_cast<int>(st);
        if (!status_has_body(status)) {
            bodiless = true;
            return out.send(status, filter_response_headers(hs), "");
        }
        return out.begin(status, filter_response_headers(hs));
    };
    RawChunkCallback on_chunk = [&](const char* data, size_t len) {
        if (bodiless) return true;
        return out.write(data, len);
    };

    HttpResponse resp = http_->stream_request(req.method, url, req.body, headers,
                                              on_head, on_chunk,
                                              config_.timeout_seconds);
    if (!started) {
        std::cerr << "[proxy] Upstream unreachable: " << url << "\n";
        send_bad_gateway(out);
        return;
    }
    if (bodiless) return;
    if (!resp.complete)
        std::cerr << "[proxy] Relay of " << req.method << " " << req.path
                  << " ended early\n";
    out.end();
}

} // namespace thinkproxy
