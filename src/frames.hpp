#pragma once
#include "normalized_stream.hpp"
#include "passthrough.hpp"
#include "source_stream.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace gaistream {

enum class Transport { SSE, NDJSON };

inline const char* transport_name(Transport t) {
    switch (t) {
        case Transport::SSE: return "sse";
        case Transport::NDJSON: return "ndjson";
    }
    return "sse";
}

// How a protocol writer's stream() ended. Transport failures are thrown.
enum class StreamOutcome { Completed, Cancelled };

// One transport-ready unit of output.
struct Frame {
    std::string event; // SSE event name; empty omits the event line
    std::string data;  // serialized payload, single line
    bool error = false;
    std::optional<int64_t> retry_after_ms;
};

// Pull-based producer of frames consumed by the protocol writers.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Block for the next frame; nullopt when the underlying stream ends or
    // was closed.
    virtual std::optional<Frame> next() = 0;

    // Unblock next() and release the underlying stream. Idempotent.
    virtual void close() = 0;

    // Frame written once after the stream is exhausted.
    virtual Frame terminal() const = 0;
};

// gai.events.v1 frames backed by the normalized pipeline.
class NormalizedFrames : public FrameSource {
public:
    NormalizedFrames(NormalizedStream& stream, Transport transport,
                     bool compact_json = true, bool include_timestamp = false);

    std::optional<Frame> next() override;
    void close() override { stream_.close(); }
    Frame terminal() const override;

private:
    NormalizedStream& stream_;
    Transport transport_;
    bool compact_json_;
    bool include_timestamp_;
};

// OpenAI-compatible frames straight from the source stream. Unmappable
// events are skipped.
class PassthroughFrames : public FrameSource {
public:
    PassthroughFrames(SourceStream& source, Transport transport);

    std::optional<Frame> next() override;
    void close() override { source_.close(); }
    Frame terminal() const override;

    size_t dropped() const { return converter_.dropped(); }

private:
    SourceStream& source_;
    Transport transport_;
    PassthroughConverter converter_;
};

} // namespace gaistream
