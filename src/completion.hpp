#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace thinkproxy {

// Payloads are kept in upstream key order so rewritten events differ from the
// originals only in the fields we touch.
using Json = nlohmann::ordered_json;

// Object inside each choice that carries the generated text.
enum class ChoiceKind {
    Delta,   // streamed chunk: choices[i].delta
    Message, // whole response: choices[i].message
};

// Narrow view over one choice's delta/message object. Only the text field and
// the reasoning field are read or written; every other key is left alone.
class ChoiceText {
public:
    ChoiceText(int index, Json& body) : index_(index), body_(&body) {}

    int index() const { return index_; }

    const std::string& text() const;
    void set_text(const std::string& text);
    void remove_text();

    // Append to the reasoning field, creating it when absent or not a string.
    void append_reasoning(const std::string& field, const std::string& reasoning);

private:
    int index_;
    Json* body_;
};

// Choices whose delta/message has a string "content". Choices without text
// (role-only chunks, tool calls, null content) are not returned. The view
// borrows from payload and is invalidated when payload is modified
// structurally.
std::vector<ChoiceText> text_choices(Json& payload, ChoiceKind kind);

// True if payload is an object with a "choices" array.
bool has_choices(const Json& payload);

// Top-level fields identifying a completion (id, object, created, model,
// system_fingerprint), used to build synthetic chunks.
Json completion_envelope(const Json& payload);

// Serialize without throwing on invalid UTF-8 in model output.
std::string dump_payload(const Json& payload);

} // namespace thinkproxy
