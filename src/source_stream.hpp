#pragma once
#include "event.hpp"
#include "bounded_queue.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>

namespace gaistream {

// Ordered, closable sequence of source events (implemented by providers).
class SourceStream {
public:
    virtual ~SourceStream() = default;

    // Block until the next event is available. nullopt at end of stream or
    // after close().
    virtual std::optional<Event> next() = 0;

    // Stop the producer and unblock next(). Idempotent.
    virtual void close() = 0;
};

// Queue-backed SourceStream: a producer thread emits, the consumer reads.
class ChannelStream : public SourceStream {
public:
    explicit ChannelStream(size_t capacity = 100);

    // Producer side. Blocks while the queue is full; false once the
    // consumer closed the stream.
    bool emit(Event event);

    // Producer side: no more events. Queued events are still delivered.
    void finish();

    std::optional<Event> next() override;
    void close() override;

    // Invoked exactly once, on the first close().
    void set_on_close(std::function<void()> hook);

    bool closed() const { return closed_.load(); }

private:
    BoundedQueue<Event> queue_;
    std::atomic<bool> closed_{false};
    std::mutex hook_mutex_;
    std::function<void()> on_close_;
};

} // namespace gaistream
