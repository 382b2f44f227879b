#pragma once
#include "cancel.hpp"
#include "event.hpp"
#include "frames.hpp"
#include "response.hpp"
#include "source_stream.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace gaistream {

struct NDJSONOptions {
    size_t buffer_size = 8192;
    std::chrono::milliseconds flush_interval{100};
    bool compact_json = true;       // false: full normalized record per line
    bool include_timestamp = false; // unix seconds in "timestamp"
};

// Newline-delimited JSON writer for one connection. One line per frame,
// flushed after every line; a timer flushes as well so slow producers never
// leave bytes sitting in the buffer for longer than flush_interval.
class NDJSONWriter {
public:
    explicit NDJSONWriter(ResponseWriter& out, NDJSONOptions options = {});

    // Same contract as SSEWriter::stream.
    StreamOutcome stream(FrameSource& frames, const CancelToken& cancel = {});

    const NDJSONOptions& options() const { return options_; }
    size_t lines_sent() const { return lines_.load(); }
    size_t periodic_flushes() const { return periodic_flushes_.load(); }

private:
    void flush_loop(FrameSource& frames);
    void stop_flush_loop();
    void write_line(const std::string& line);

    ResponseWriter& out_;
    NDJSONOptions options_;
    ResponseBuffer buffer_;
    std::mutex write_mutex_;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool timer_stop_ = false;

    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> lines_{0};
    std::atomic<size_t> periodic_flushes_{0};
    std::exception_ptr flush_error_;
};

// ── Reading ─────────────────────────────────────────────────────

// Incremental NDJSON reader; chunks may split lines anywhere. Blank lines
// are skipped, a line that is not JSON throws std::invalid_argument.
class NDJSONReader {
public:
    // Return false from the callback to stop reading.
    using LineCallback = std::function<bool(const nlohmann::json& line)>;

    void feed(const std::string& chunk, const LineCallback& callback);

    // Parse a trailing line that had no newline. Call at end of input.
    void finish(const LineCallback& callback);

private:
    bool emit(std::string line, const LineCallback& callback);

    std::string buffer_;
};

// Map one NDJSON line back to a source event. Accepts gai.events.v1 type
// names and the snake-case kind names; anything else becomes a RawEvent.
Event ndjson_to_event(const nlohmann::json& line);

// SourceStream over an NDJSON byte stream, e.g. an upstream HTTP body.
// `read` fills `chunk` with the next bytes and returns false at end of
// input. A malformed line or a failed read ends the stream with one error
// event. next() is pulled by a single consumer; close() may come from any
// thread and takes effect at the next call.
class NDJSONSource : public SourceStream {
public:
    using ReadFn = std::function<bool(std::string& chunk)>;

    explicit NDJSONSource(ReadFn read);

    std::optional<Event> next() override;
    void close() override;

private:
    void fill();

    ReadFn read_;
    NDJSONReader reader_;
    std::deque<Event> pending_;
    bool done_ = false;
    std::atomic<bool> closed_{false};
};

} // namespace gaistream
