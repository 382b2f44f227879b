#include "frames.hpp"
#include "util.hpp"

using ojson = nlohmann::ordered_json;

namespace gaistream {

// ── NormalizedFrames ────────────────────────────────────────────

NormalizedFrames::NormalizedFrames(NormalizedStream& stream, Transport transport,
                                   bool compact_json, bool include_timestamp)
    : stream_(stream),
      transport_(transport),
      compact_json_(compact_json),
      include_timestamp_(include_timestamp) {}

std::optional<Frame> NormalizedFrames::next() {
    auto event = stream_.next();
    if (!event) return std::nullopt;

    Frame frame;
    if (event->error) {
        frame.error = true;
        if (event->error->retry_after_ms > 0) {
            frame.retry_after_ms = event->error->retry_after_ms;
        }
    }

    if (transport_ == Transport::SSE) {
        frame.event = event->type;
        frame.data = event->compact_json();
        return frame;
    }

    ojson line = compact_json_ ? event->compact() : normalized_to_json(*event);
    if (event->is(event_types::Finish)) line["finished"] = true;
    if (include_timestamp_) line["timestamp"] = event->ts / 1000;
    frame.data = dump_wire(line);
    return frame;
}

Frame NormalizedFrames::terminal() const {
    ojson done;
    done["type"] = "done";
    done["finished"] = true;

    Frame frame;
    if (transport_ == Transport::SSE) {
        frame.event = "done";
    } else if (include_timestamp_) {
        done["timestamp"] = epoch_millis() / 1000;
    }
    frame.data = dump_wire(done);
    return frame;
}

// ── PassthroughFrames ───────────────────────────────────────────

PassthroughFrames::PassthroughFrames(SourceStream& source, Transport transport)
    : source_(source), transport_(transport) {}

std::optional<Frame> PassthroughFrames::next() {
    while (auto event = source_.next()) {
        auto chunk = converter_.convert(*event);
        if (!chunk) continue;
        Frame frame;
        frame.data = dump_wire(*chunk);
        return frame;
    }
    return std::nullopt;
}

Frame PassthroughFrames::terminal() const {
    Frame frame;
    frame.data = transport_ == Transport::SSE ? "[DONE]" : R"({"object":"done"})";
    return frame;
}

} // namespace gaistream
