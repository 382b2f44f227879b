#pragma once
#include "bounded_queue.hpp"
#include "normalize.hpp"
#include "source_stream.hpp"
#include <atomic>
#include <optional>
#include <thread>

namespace gaistream {

constexpr size_t kDefaultQueueCapacity = 100;

// Background task that drains a SourceStream through a Normalizer onto a
// bounded FIFO. A slow consumer blocks the forwarding task once the queue is
// full; it never grows without bound.
class NormalizedStream {
public:
    NormalizedStream(SourceStream& source, Normalizer& normalizer,
                     size_t capacity = kDefaultQueueCapacity);
    ~NormalizedStream();

    NormalizedStream(const NormalizedStream&) = delete;
    NormalizedStream& operator=(const NormalizedStream&) = delete;

    // Launch the forwarding task. Call once.
    void start();

    // Next normalized event in source order; nullopt once the source is
    // exhausted (after draining) or the stream was closed.
    std::optional<NormalizedEvent> next();

    // Stop forwarding and close the source. Idempotent, callable from any
    // thread; an in-flight forward attempt is aborted, not blocked.
    void close();

    bool closed() const { return closed_.load(); }

private:
    void forward();

    SourceStream& source_;
    Normalizer& normalizer_;
    BoundedQueue<NormalizedEvent> events_;
    std::atomic<bool> closed_{false};
    std::thread worker_;
};

} // namespace gaistream
