#pragma once
#include <string>
#include <functional>

namespace thinkproxy {

struct SSEEvent {
    std::string event; // event type; empty for the default "message" type
    std::string data;  // payload, multiple data lines joined with '\n'
    std::string id;
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental decoder for a text/event-stream body. Frames may be split
// across any number of feed() calls; an event is delivered only once its
// blank-line delimiter has arrived.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const std::string& chunk, const SSECallback& callback);
    bool feed(const char* data, size_t len, const SSECallback& callback);

    // Upstream closed: deliver a trailing frame that never got its delimiter.
    bool finish(const SSECallback& callback);

    // Reset parser state
    void reset();

private:
    bool process_line(std::string line, const SSECallback& callback);
    bool dispatch(const SSECallback& callback);

    std::string buffer_;
    SSEEvent pending_;
    bool has_data_ = false;
};

// Stream terminator sent by OpenAI-compatible servers. Not JSON.
constexpr const char* kDoneSentinel = "[DONE]";

bool is_done_sentinel(const std::string& data);

// Re-encode one event with the same framing the parser accepts:
// optional "event:" and "id:" lines, one "data: " line per payload line,
// then a blank line.
std::string encode_event(const SSEEvent& event);

// Encode a bare data payload ("data: <payload>\n\n").
std::string encode_data(const std::string& data);

} // namespace thinkproxy
