#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gaistream {

// ── Framing ─────────────────────────────────────────────────────

// One SSE frame: optional id/event/retry lines, one data line per line of
// `data`, blank line terminator.
std::string format_sse_event(const std::string& event, const std::string& data,
                             std::optional<int64_t> id = std::nullopt,
                             std::optional<int64_t> retry_ms = std::nullopt);

// Comment frame (": text\n\n"); carries no data field.
std::string format_sse_comment(const std::string& text);

// ── Parsing ─────────────────────────────────────────────────────

struct SSEEvent {
    std::string event; // event type (e.g., "text.delta", "done")
    std::string data;  // raw data, lines joined with '\n'
    std::string id;
    std::optional<int64_t> retry_ms;
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental parser for SSE text; chunks may split anywhere.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events
    void feed(const std::string& chunk, const SSECallback& callback);

    // Number of comment lines seen so far (keep-alives)
    size_t comment_count() const { return comments_; }

    void reset();

private:
    std::string buffer_;
    SSEEvent current_;
    bool has_data_ = false;
    size_t comments_ = 0;
};

} // namespace gaistream
