#include "completion.hpp"

namespace thinkproxy {

static const char* const kTextField = "content";

const std::string& ChoiceText::text() const {
    return (*body_)[kTextField].get_ref<const std::string&>();
}

void ChoiceText::set_text(const std::string& text) {
    (*body_)[kTextField] = text;
}

void ChoiceText::remove_text() {
    body_->erase(kTextField);
}

void ChoiceText::append_reasoning(const std::string& field, const std::string& reasoning) {
    auto it = body_->find(field);
    if (it != body_->end() && it->is_string()) {
        it->get_ref<std::string&>() += reasoning;
    } else {
        (*body_)[field] = reasoning;
    }
}

bool has_choices(const Json& payload) {
    return payload.is_object() && payload.contains("choices") &&
           payload["choices"].is_array();
}

std::vector<ChoiceText> text_choices(Json& payload, ChoiceKind kind) {
    std::vector<ChoiceText> out;
    if (!has_choices(payload)) return out;

    const char* key = kind == ChoiceKind::Delta ? "delta" : "message";
    auto& choices = payload["choices"];
    for (size_t i = 0; i < choices.size(); ++i) {
        auto& choice = choices[i];
        if (!choice.is_object()) continue;
        auto body = choice.find(key);
        if (body == choice.end() || !body->is_object()) continue;
        auto text = body->find(kTextField);
        if (text == body->end() || !text->is_string()) continue;

        int index = static_cast<int>(i);
        if (choice.contains("index") && choice["index"].is_number_integer())
            index = choice["index"].get<int>();
        out.emplace_back(index, *body);
    }
    return out;
}

Json completion_envelope(const Json& payload) {
    Json envelope = Json::object();
    if (!payload.is_object()) return envelope;
    for (const char* key : {"id", "object", "created", "model", "system_fingerprint"}) {
        auto it = payload.find(key);
        if (it != payload.end()) envelope[key] = *it;
    }
    return envelope;
}

std::string dump_payload(const Json& payload) {
    return payload.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace thinkproxy
