#include "transform.hpp"

#include <iostream>

namespace thinkproxy {

SplitResult split_reasoning(const std::string& text, const MarkerPair& markers) {
    ScannerState state = Outside{};
    SplitResult result = advance(state, text, markers);
    SplitResult tail = flush(state);
    result.visible += tail.visible;
    result.reasoning += tail.reasoning;
    return result;
}

int transform_completion(Json& payload, const MarkerPair& markers,
                         const std::string& reasoning_field) {
    int count = 0;
    for (auto& choice : text_choices(payload, ChoiceKind::Message)) {
        SplitResult split = split_reasoning(choice.text(), markers);
        if (!split.reasoning.empty())
            choice.append_reasoning(reasoning_field, split.reasoning);
        choice.set_text(split.visible);
        ++count;
    }
    return count;
}

std::string transform_completion_body(const std::string& body,
                                      const MarkerPair& markers,
                                      const std::string& reasoning_field) {
    Json payload = Json::parse(body, nullptr, false);
    if (payload.is_discarded()) {
        std::cerr << "[transform] Response body is not JSON, passing through ("
                  << body.size() << " bytes)\n";
        return body;
    }
    if (!has_choices(payload)) {
        std::cerr << "[transform] Response has no choices array, passing through\n";
        return body;
    }
    if (transform_completion(payload, markers, reasoning_field) == 0)
        return body;
    return dump_payload(payload);
}

} // namespace thinkproxy
