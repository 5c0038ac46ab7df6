#pragma once
#include <string>
#include <variant>

namespace thinkproxy {

// Literal delimiters of a reasoning block in model output.
// Matching is exact and case-sensitive.
struct MarkerPair {
    std::string start;
    std::string end;

    // Throws std::invalid_argument if either marker is empty or both are equal.
    MarkerPair(std::string start_marker, std::string end_marker);

    // "<think>" / "</think>"
    static MarkerPair think_tags();
};

// Emitting visible text, waiting for the start marker.
struct Outside {};

// Emitting reasoning text, waiting for the end marker.
struct Inside {};

// The previous fragment ended with a strict prefix of `target`. The held
// bytes belong to neither delta until the next fragment confirms or refutes
// the marker.
struct PartialMarker {
    enum class Target { Start, End };

    std::string buffer;
    Target target = Target::Start;
};

using ScannerState = std::variant<Outside, Inside, PartialMarker>;

struct SplitResult {
    std::string visible;
    std::string reasoning;

    bool empty() const { return visible.empty() && reasoning.empty(); }
};

// Scan one fragment and update `state` in place. Marker literals are consumed
// and never appear in either delta. A start marker seen while inside a block
// is literal reasoning text (blocks do not nest).
SplitResult advance(ScannerState& state, const std::string& input,
                    const MarkerPair& markers);

// End of input: bytes held by a PartialMarker are emitted as literal text to
// the delta that was active before the partial match, and the state returns
// to Outside or Inside. Outside and Inside have nothing to flush.
SplitResult flush(ScannerState& state);

// True while a block is open, including a held prefix of the end marker.
bool in_reasoning(const ScannerState& state);

} // namespace thinkproxy
