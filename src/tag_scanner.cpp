#include "tag_scanner.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace thinkproxy {

MarkerPair::MarkerPair(std::string start_marker, std::string end_marker)
    : start(std::move(start_marker)), end(std::move(end_marker)) {
    if (start.empty() || end.empty())
        throw std::invalid_argument("reasoning markers must not be empty");
    if (start == end)
        throw std::invalid_argument("start and end markers must differ: " + start);
}

MarkerPair MarkerPair::think_tags() {
    return MarkerPair("<think>", "</think>");
}

// Length of the longest suffix of text[from:] that is a proper prefix of
// marker. The caller has already ruled out a full match in that range, so the
// leftmost candidate position wins.
static size_t held_suffix_length(const std::string& text, size_t from,
                                 const std::string& marker) {
    size_t remaining = text.size() - from;
    size_t longest = std::min(remaining, marker.size() - 1);
    for (size_t len = longest; len > 0; --len) {
        if (text.compare(text.size() - len, len, marker, 0, len) == 0)
            return len;
    }
    return 0;
}

SplitResult advance(ScannerState& state, const std::string& input,
                    const MarkerPair& markers) {
    SplitResult result;

    // Held bytes are re-scanned together with the new fragment. Positions
    // that turn out not to start the marker are emitted like any other text.
    std::string text;
    bool inside = false;
    if (auto* partial = std::get_if<PartialMarker>(&state)) {
        inside = partial->target == PartialMarker::Target::End;
        text = partial->buffer + input;
    } else {
        inside = std::holds_alternative<Inside>(state);
        text = input;
    }

    size_t pos = 0;
    while (pos < text.size()) {
        const std::string& marker = inside ? markers.end : markers.start;
        std::string& out = inside ? result.reasoning : result.visible;

        size_t hit = text.find(marker, pos);
        if (hit != std::string::npos) {
            out.append(text, pos, hit - pos);
            pos = hit + marker.size();
            inside = !inside;
            continue;
        }

        size_t held = held_suffix_length(text, pos, marker);
        out.append(text, pos, text.size() - pos - held);
        if (held > 0) {
            PartialMarker partial;
            partial.buffer = text.substr(text.size() - held);
            partial.target = inside ? PartialMarker::Target::End
                                    : PartialMarker::Target::Start;
            state = std::move(partial);
            return result;
        }
        break;
    }

    if (inside)
        state = Inside{};
    else
        state = Outside{};
    return result;
}

SplitResult flush(ScannerState& state) {
    SplitResult result;
    auto* partial = std::get_if<PartialMarker>(&state);
    if (!partial) return result;

    if (partial->target == PartialMarker::Target::End) {
        result.reasoning = std::move(partial->buffer);
        state = Inside{};
    } else {
        result.visible = std::move(partial->buffer);
        state = Outside{};
    }
    return result;
}

bool in_reasoning(const ScannerState& state) {
    if (std::holds_alternative<Inside>(state)) return true;
    auto* partial = std::get_if<PartialMarker>(&state);
    return partial && partial->target == PartialMarker::Target::End;
}

} // namespace thinkproxy
