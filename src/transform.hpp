#pragma once
#include "completion.hpp"
#include "tag_scanner.hpp"
#include <string>

namespace thinkproxy {

// Split a complete text blob in one pass. Scanning starts Outside and ends
// with a flush, so a trailing partial marker is kept as literal text and an
// unterminated block yields everything after the start marker as reasoning.
SplitResult split_reasoning(const std::string& text, const MarkerPair& markers);

// Rewrite every choices[i].message of a whole chat-completion response:
// visible text replaces "content", non-empty reasoning goes to
// reasoning_field. Returns the number of messages that carried text.
int transform_completion(Json& payload, const MarkerPair& markers,
                         const std::string& reasoning_field);

// Body-level wrapper used by the proxy. A body that is not JSON or has no
// choices is returned unchanged (and logged).
std::string transform_completion_body(const std::string& body,
                                      const MarkerPair& markers,
                                      const std::string& reasoning_field);

} // namespace thinkproxy
