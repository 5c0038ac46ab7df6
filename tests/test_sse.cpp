#include <catch2/catch.hpp>
#include "sse.hpp"
#include <vector>

using namespace thinkproxy;

// Helper: collect all events from a single feed
static std::vector<SSEEvent> collect_events(SSEParser& parser, const std::string& chunk) {
    std::vector<SSEEvent> events;
    parser.feed(chunk, [&](const SSEEvent& ev) {
        events.push_back(ev);
        return true;
    });
    return events;
}

// ── Basic event parsing ──────────────────────────────────────────

TEST_CASE("SSEParser: single data-only event", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
    REQUIRE(events[0].event.empty());
}

TEST_CASE("SSEParser: event with named type and id", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "event: completion\nid: 7\ndata: {}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "completion");
    REQUIRE(events[0].id == "7");
    REQUIRE(events[0].data == "{}");
}

TEST_CASE("SSEParser: multiple events in one chunk", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: first\n\ndata: second\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "first");
    REQUIRE(events[1].data == "second");
}

TEST_CASE("SSEParser: multi-line data concatenated", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: line1\ndata: line2\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "line1\nline2");
}

TEST_CASE("SSEParser: data field without space after colon", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data:no_space\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "no_space");
}

TEST_CASE("SSEParser: only one leading space is stripped", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data:  indented\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == " indented");
}

TEST_CASE("SSEParser: empty data line yields an empty event", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data:\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data.empty());
}

// ── Streaming / chunked delivery ─────────────────────────────────

TEST_CASE("SSEParser: event split across two chunks", "[sse]") {
    SSEParser parser;

    auto events1 = collect_events(parser, "data: hel");
    REQUIRE(events1.empty());

    auto events2 = collect_events(parser, "lo\n\n");
    REQUIRE(events2.size() == 1);
    REQUIRE(events2[0].data == "hello");
}

TEST_CASE("SSEParser: delimiter split across chunks", "[sse]") {
    SSEParser parser;

    auto ev1 = collect_events(parser, "data: {\"x\":1}\n");
    REQUIRE(ev1.empty());

    auto ev2 = collect_events(parser, "\n");
    REQUIRE(ev2.size() == 1);
    REQUIRE(ev2[0].data == "{\"x\":1}");
}

TEST_CASE("SSEParser: fields survive across feeds", "[sse]") {
    SSEParser parser;

    REQUIRE(collect_events(parser, "event: mess").empty());
    REQUIRE(collect_events(parser, "age\n").empty());
    REQUIRE(collect_events(parser, "data: a\n").empty());

    auto ev = collect_events(parser, "data: b\n\n");
    REQUIRE(ev.size() == 1);
    REQUIRE(ev[0].event == "message");
    REQUIRE(ev[0].data == "a\nb");
}

TEST_CASE("SSEParser: byte-at-a-time delivery", "[sse]") {
    SSEParser parser;
    const std::string body = "data: one\r\n\r\n: keepalive\n\ndata: two\n\n";
    std::vector<SSEEvent> events;
    for (char c : body) {
        parser.feed(&c, 1, [&](const SSEEvent& ev) {
            events.push_back(ev);
            return true;
        });
    }
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "one");
    REQUIRE(events[1].data == "two");
}

TEST_CASE("SSEParser: empty lines between events", "[sse]") {
    SSEParser parser;
    // Extra blank lines should not produce extra events (no data)
    auto events = collect_events(parser, "data: a\n\n\n\ndata: b\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "a");
    REQUIRE(events[1].data == "b");
}

// ── Carriage return handling ─────────────────────────────────────

TEST_CASE("SSEParser: handles \\r\\n line endings", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: hello\r\n\r\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}

// ── Callback stopping ────────────────────────────────────────────

TEST_CASE("SSEParser: callback returning false stops parsing", "[sse]") {
    SSEParser parser;
    std::vector<SSEEvent> events;
    bool ok = parser.feed("data: first\n\ndata: second\n\n", [&](const SSEEvent& ev) {
        events.push_back(ev);
        return false; // stop after first event
    });
    REQUIRE_FALSE(ok);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "first");

    // The unread event is still buffered for the next feed
    auto rest = collect_events(parser, "");
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].data == "second");
}

// ── finish ───────────────────────────────────────────────────────

TEST_CASE("SSEParser: finish delivers a frame missing its delimiter", "[sse]") {
    SSEParser parser;
    REQUIRE(collect_events(parser, "data: last").empty());

    std::vector<SSEEvent> events;
    REQUIRE(parser.finish([&](const SSEEvent& ev) {
        events.push_back(ev);
        return true;
    }));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "last");
}

TEST_CASE("SSEParser: finish with nothing pending is a no-op", "[sse]") {
    SSEParser parser;
    collect_events(parser, "data: done\n\n");
    int calls = 0;
    REQUIRE(parser.finish([&](const SSEEvent&) { ++calls; return true; }));
    REQUIRE(calls == 0);
}

// ── Reset ────────────────────────────────────────────────────────

TEST_CASE("SSEParser: reset clears buffer state", "[sse]") {
    SSEParser parser;
    collect_events(parser, "data: partial\ndata: more");
    parser.reset();

    auto events = collect_events(parser, "data: fresh\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "fresh");
}

// ── No events ────────────────────────────────────────────────────

TEST_CASE("SSEParser: empty input produces no events", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "");
    REQUIRE(events.empty());
}

TEST_CASE("SSEParser: comment lines ignored", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, ": this is a comment\ndata: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}

// ── Encoding ─────────────────────────────────────────────────────

TEST_CASE("encode_data: single line payload", "[sse]") {
    REQUIRE(encode_data("{\"a\":1}") == "data: {\"a\":1}\n\n");
}

TEST_CASE("encode_event: named event with id and multi-line data", "[sse]") {
    SSEEvent ev;
    ev.event = "chunk";
    ev.id = "3";
    ev.data = "a\nb";
    REQUIRE(encode_event(ev) == "event: chunk\nid: 3\ndata: a\ndata: b\n\n");
}

TEST_CASE("encode_event: output parses back to the same event", "[sse]") {
    SSEEvent ev;
    ev.event = "x";
    ev.data = "line one\n\nline three";

    SSEParser parser;
    auto events = collect_events(parser, encode_event(ev));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "x");
    REQUIRE(events[0].data == ev.data);
}

TEST_CASE("is_done_sentinel: exact match only", "[sse]") {
    REQUIRE(is_done_sentinel("[DONE]"));
    REQUIRE_FALSE(is_done_sentinel("[DONE] "));
    REQUIRE_FALSE(is_done_sentinel("{\"done\":true}"));
    REQUIRE(encode_data(kDoneSentinel) == "data: [DONE]\n\n");
}
