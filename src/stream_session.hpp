#pragma once
#include "completion.hpp"
#include "tag_scanner.hpp"
#include <map>
#include <optional>
#include <string>

namespace thinkproxy {

// Reasoning extraction state for one streamed chat completion. Owns one
// scanner state per choice index and rewrites each chunk payload as it
// arrives. Not shared between requests and not thread-safe.
class StreamSession {
public:
    StreamSession(MarkerPair markers, std::string reasoning_field);

    // Rewrite one decoded event payload (the data of one SSE frame, sentinel
    // excluded). Returns the payload to forward, or nullopt when the payload
    // is not JSON and the frame must be dropped.
    std::optional<std::string> transform(const std::string& data);

    // Normal end of stream. Resolves bytes still held for choices that never
    // reported a finish_reason and returns a synthetic chunk carrying them,
    // if there were any.
    std::optional<std::string> finish();

    // Upstream failure or client disconnect: held bytes are discarded.
    void abort();

    size_t events_seen() const { return events_seen_; }
    size_t frames_dropped() const { return frames_dropped_; }

    // Scanner state of a choice; Outside for a choice not seen yet.
    const ScannerState& state(int choice_index) const;

private:
    // A choice with a non-null finish_reason is done: its held bytes are
    // resolved into that event's delta and its state is dropped.
    bool close_finished_choices(Json& payload);

    MarkerPair markers_;
    std::string reasoning_field_;
    std::map<int, ScannerState> states_;
    Json envelope_;
    size_t events_seen_ = 0;
    size_t frames_dropped_ = 0;
};

} // namespace thinkproxy
