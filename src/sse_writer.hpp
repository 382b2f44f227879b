#pragma once
#include "cancel.hpp"
#include "frames.hpp"
#include "response.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>

namespace gaistream {

struct SSEOptions {
    std::chrono::milliseconds heartbeat_interval{15000};
    bool flush_after_write = true;
    int max_retries = 3;         // 0 disables retry hints
    int64_t retry_hint_ms = 5000;
    size_t buffer_size = 4096;
    bool include_id = false;     // numbered id: lines for replay
};

// Server-Sent Events writer for one connection.
//
// Idle -> Streaming -> (Completing | Aborted). The event loop and the
// heartbeat loop share the response; every write goes through write_mutex_.
class SSEWriter {
public:
    enum class State { Idle, Streaming, Completing, Aborted };

    explicit SSEWriter(ResponseWriter& out, SSEOptions options = {});

    // Write headers, then every frame, then the terminal frame. Returns
    // Cancelled if `cancel` fired first; throws TransportError when the
    // client goes away. `frames` is closed on every exit path.
    StreamOutcome stream(FrameSource& frames, const CancelToken& cancel = {});

    State state() const { return state_.load(); }
    size_t heartbeats_sent() const { return heartbeats_.load(); }
    size_t frames_sent() const { return frames_sent_.load(); }

private:
    void heartbeat_loop(FrameSource& frames);
    void stop_heartbeat();
    void write_frame(const Frame& frame);

    ResponseWriter& out_;
    SSEOptions options_;
    ResponseBuffer buffer_;
    std::mutex write_mutex_;

    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
    bool heartbeat_stop_ = false;

    std::atomic<State> state_{State::Idle};
    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> heartbeats_{0};
    std::atomic<size_t> frames_sent_{0};
    std::exception_ptr heartbeat_error_;
    int64_t next_id_ = 1;
};

} // namespace gaistream
