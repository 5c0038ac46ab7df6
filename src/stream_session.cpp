#include "stream_session.hpp"

#include <iostream>
#include <utility>

namespace thinkproxy {

static const ScannerState kOutside = Outside{};

static int choice_index(const Json& choice, size_t position) {
    auto it = choice.find("index");
    if (it != choice.end() && it->is_number_integer()) return it->get<int>();
    return static_cast<int>(position);
}

StreamSession::StreamSession(MarkerPair markers, std::string reasoning_field)
    : markers_(std::move(markers))
    , reasoning_field_(std::move(reasoning_field))
    , envelope_(Json::object())
{}

std::optional<std::string> StreamSession::transform(const std::string& data) {
    ++events_seen_;

    Json payload = Json::parse(data, nullptr, false);
    if (payload.is_discarded()) {
        ++frames_dropped_;
        std::cerr << "[stream] Dropping malformed event payload: "
                  << data.substr(0, 200) << "\n";
        return std::nullopt;
    }

    if (has_choices(payload)) envelope_ = completion_envelope(payload);

    bool changed = false;
    for (auto& choice : text_choices(payload, ChoiceKind::Delta)) {
        auto it = states_.emplace(choice.index(), Outside{}).first;
        SplitResult split = advance(it->second, choice.text(), markers_);
        changed = true;

        if (split.empty()) {
            choice.remove_text();
            continue;
        }
        if (!split.reasoning.empty())
            choice.append_reasoning(reasoning_field_, split.reasoning);
        choice.set_text(split.visible);
    }
    if (close_finished_choices(payload)) changed = true;

    // role-only, tool-call or usage chunk
    if (!changed) return data;
    return dump_payload(payload);
}

bool StreamSession::close_finished_choices(Json& payload) {
    if (!has_choices(payload)) return false;

    bool changed = false;
    auto& choices = payload["choices"];
    for (size_t i = 0; i < choices.size(); ++i) {
        auto& choice = choices[i];
        if (!choice.is_object()) continue;
        auto reason = choice.find("finish_reason");
        if (reason == choice.end() || reason->is_null()) continue;

        int index = choice_index(choice, i);
        auto it = states_.find(index);
        if (it == states_.end()) continue;
        SplitResult tail = flush(it->second);
        states_.erase(it);
        if (tail.empty()) continue;

        // Held bytes must reach the client with the event that ends the choice.
        auto delta = choice.find("delta");
        if (delta == choice.end() || !delta->is_object()) {
            choice["delta"] = Json::object();
            delta = choice.find("delta");
        }
        auto content = delta->find("content");
        if (content != delta->end() && content->is_string())
            content->get_ref<std::string&>() += tail.visible;
        else
            (*delta)["content"] = tail.visible;
        if (!tail.reasoning.empty()) {
            ChoiceText view(index, *delta);
            view.append_reasoning(reasoning_field_, tail.reasoning);
        }
        changed = true;
    }
    return changed;
}

std::optional<std::string> StreamSession::finish() {
    Json choices = Json::array();
    for (auto& [index, state] : states_) {
        SplitResult tail = flush(state);
        if (tail.empty()) continue;

        Json delta = Json::object();
        delta["content"] = tail.visible;
        if (!tail.reasoning.empty()) delta[reasoning_field_] = tail.reasoning;
        choices.push_back({{"index", index}, {"delta", delta}, {"finish_reason", nullptr}});
    }
    states_.clear();
    if (choices.empty()) return std::nullopt;

    Json chunk = envelope_;
    if (!chunk.contains("object")) chunk["object"] = "chat.completion.chunk";
    chunk["choices"] = std::move(choices);
    return dump_payload(chunk);
}

void StreamSession::abort() {
    size_t held = 0;
    for (auto& entry : states_) {
        if (auto* partial = std::get_if<PartialMarker>(&entry.second))
            held += partial->buffer.size();
    }
    if (held > 0)
        std::cerr << "[stream] Stream aborted, discarding " << held
                  << " held bytes\n";
    states_.clear();
}

const ScannerState& StreamSession::state(int choice_index) const {
    auto it = states_.find(choice_index);
    return it != states_.end() ? it->second : kOutside;
}

} // namespace thinkproxy
