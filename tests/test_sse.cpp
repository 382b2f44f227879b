#include <catch2/catch_test_macros.hpp>
#include "sse.hpp"
#include <vector>

using namespace gaistream;

static std::vector<SSEEvent> parse_all(SSEParser& parser, const std::string& chunk) {
    std::vector<SSEEvent> events;
    parser.feed(chunk, [&](const SSEEvent& ev) {
        events.push_back(ev);
        return true;
    });
    return events;
}

// ── Formatting ──────────────────────────────────────────────────

TEST_CASE("format_sse_event: event and data lines", "[sse]") {
    REQUIRE(format_sse_event("text.delta", R"({"text":"hi"})") ==
            "event: text.delta\ndata: {\"text\":\"hi\"}\n\n");
}

TEST_CASE("format_sse_event: id and retry lines precede data", "[sse]") {
    REQUIRE(format_sse_event("error", "{}", 7, 5000) ==
            "id: 7\nevent: error\nretry: 5000\ndata: {}\n\n");
}

TEST_CASE("format_sse_event: empty event name omits the event line", "[sse]") {
    REQUIRE(format_sse_event("", "[DONE]") == "data: [DONE]\n\n");
}

TEST_CASE("format_sse_event: multi-line data becomes several data lines", "[sse]") {
    REQUIRE(format_sse_event("note", "a\nb") == "event: note\ndata: a\ndata: b\n\n");
}

TEST_CASE("format_sse_comment: comment frame has no data field", "[sse]") {
    REQUIRE(format_sse_comment("keep-alive") == ": keep-alive\n\n");
}

// ── Parsing ─────────────────────────────────────────────────────

TEST_CASE("SSEParser: data-only event", "[sse]") {
    SSEParser parser;
    auto events = parse_all(parser, "data: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
    REQUIRE(events[0].event.empty());
}

TEST_CASE("SSEParser: reads id, event, retry and data", "[sse]") {
    SSEParser parser;
    auto events = parse_all(parser, "id: 3\nevent: error\nretry: 1500\ndata: {}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].id == "3");
    REQUIRE(events[0].event == "error");
    REQUIRE(events[0].retry_ms == 1500);
    REQUIRE(events[0].data == "{}");
}

TEST_CASE("SSEParser: several events in one chunk", "[sse]") {
    SSEParser parser;
    auto events = parse_all(parser, "event: a\ndata: 1\n\nevent: b\ndata: 2\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].event == "a");
    REQUIRE(events[1].data == "2");
}

TEST_CASE("SSEParser: multi-line data joined with newline", "[sse]") {
    SSEParser parser;
    auto events = parse_all(parser, "data: line1\ndata: line2\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "line1\nline2");
}

TEST_CASE("SSEParser: field without space after colon", "[sse]") {
    SSEParser parser;
    auto events = parse_all(parser, "event:x\ndata:no_space\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "x");
    REQUIRE(events[0].data == "no_space");
}

TEST_CASE("SSEParser: frame split between fields keeps its event name", "[sse]") {
    SSEParser parser;
    REQUIRE(parse_all(parser, "event: text.delta\n").empty());
    auto events = parse_all(parser, "data: {}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "text.delta");
}

TEST_CASE("SSEParser: byte-at-a-time delivery", "[sse]") {
    SSEParser parser;
    std::string wire = format_sse_event("start", R"({"seq":1})") +
                       format_sse_comment("keep-alive") +
                       format_sse_event("done", R"({"type":"done"})");
    std::vector<SSEEvent> events;
    for (char c : wire) {
        auto got = parse_all(parser, std::string(1, c));
        events.insert(events.end(), got.begin(), got.end());
    }
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].event == "start");
    REQUIRE(events[1].event == "done");
    REQUIRE(parser.comment_count() == 1);
}

TEST_CASE("SSEParser: CRLF line endings", "[sse]") {
    SSEParser parser;
    auto events = parse_all(parser, "data: hello\r\n\r\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}

TEST_CASE("SSEParser: comment lines counted, never dispatched", "[sse]") {
    SSEParser parser;
    auto events = parse_all(parser, ": keep-alive\n\n: keep-alive\n\ndata: x\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(parser.comment_count() == 2);
}

TEST_CASE("SSEParser: callback returning false stops parsing", "[sse]") {
    SSEParser parser;
    std::vector<SSEEvent> events;
    parser.feed("data: first\n\ndata: second\n\n", [&](const SSEEvent& ev) {
        events.push_back(ev);
        return false;
    });
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "first");

    // The rest stays buffered for the next feed
    auto rest = parse_all(parser, "");
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].data == "second");
}

TEST_CASE("SSEParser: reset drops partial input", "[sse]") {
    SSEParser parser;
    parse_all(parser, "data: partial");
    parser.reset();
    auto events = parse_all(parser, "data: fresh\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "fresh");
}
