#include "sse.hpp"

namespace thinkproxy {

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    return feed(chunk.data(), chunk.size(), callback);
}

bool SSEParser::feed(const char* data, size_t len, const SSECallback& callback) {
    buffer_.append(data, len);

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break; // incomplete line stays buffered

        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;
        if (!process_line(std::move(line), callback)) {
            buffer_.erase(0, pos);
            return false;
        }
    }

    buffer_.erase(0, pos);
    return true;
}

bool SSEParser::finish(const SSECallback& callback) {
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!process_line(std::move(line), callback)) return false;
    }
    return dispatch(callback);
}

void SSEParser::reset() {
    buffer_.clear();
    pending_ = SSEEvent{};
    has_data_ = false;
}

bool SSEParser::process_line(std::string line, const SSECallback& callback) {
    // Remove trailing \r if present
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.empty()) {
        // Empty line = dispatch event
        return dispatch(callback);
    }
    if (line[0] == ':') {
        return true; // comment
    }

    auto colon = line.find(':');
    std::string field = line.substr(0, colon);
    std::string value;
    if (colon != std::string::npos) {
        // Handle both "field: value" (with space) and "field:value" (without)
        size_t start = colon + 1;
        if (start < line.size() && line[start] == ' ') ++start;
        value = line.substr(start);
    }

    if (field == "data") {
        if (has_data_) {
            pending_.data += '\n';
        }
        pending_.data += value;
        has_data_ = true;
    } else if (field == "event") {
        pending_.event = value;
    } else if (field == "id") {
        pending_.id = value;
    }
    // Ignore other fields (retry, unknown)
    return true;
}

bool SSEParser::dispatch(const SSECallback& callback) {
    bool keep_going = true;
    if (has_data_) {
        SSEEvent event = std::move(pending_);
        pending_ = SSEEvent{};
        has_data_ = false;
        keep_going = callback(event);
    } else {
        pending_ = SSEEvent{};
    }
    return keep_going;
}

bool is_done_sentinel(const std::string& data) {
    return data == kDoneSentinel;
}

std::string encode_event(const SSEEvent& event) {
    std::string out;
    out.reserve(event.data.size() + 16);
    if (!event.event.empty()) out += "event: " + event.event + "\n";
    if (!event.id.empty()) out += "id: " + event.id + "\n";

    size_t pos = 0;
    while (true) {
        size_t newline = event.data.find('\n', pos);
        out += "data: ";
        if (newline == std::string::npos) {
            out.append(event.data, pos, std::string::npos);
            out += '\n';
            break;
        }
        out.append(event.data, pos, newline - pos);
        out += '\n';
        pos = newline + 1;
    }
    out += '\n';
    return out;
}

std::string encode_data(const std::string& data) {
    SSEEvent event;
    event.data = data;
    return encode_event(event);
}

} // namespace thinkproxy
