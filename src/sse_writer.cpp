#include "sse_writer.hpp"
#include "error.hpp"
#include "sse.hpp"
#include <iostream>
#include <thread>

namespace gaistream {

SSEWriter::SSEWriter(ResponseWriter& out, SSEOptions options)
    : out_(out), options_(options), buffer_(out, options.buffer_size) {}

StreamOutcome SSEWriter::stream(FrameSource& frames, const CancelToken& cancel) {
    for (const auto& [name, value] : streaming_headers("text/event-stream")) {
        out_.set_header(name, value);
    }
    try {
        std::lock_guard<std::mutex> lock(write_mutex_);
        out_.commit(200);
        out_.flush();
    } catch (const TransportError&) {
        state_ = State::Aborted;
        frames.close();
        throw;
    }
    state_ = State::Streaming;

    std::thread heartbeat;
    if (options_.heartbeat_interval.count() > 0) {
        heartbeat = std::thread([this, &frames]() { heartbeat_loop(frames); });
    }

    // Disconnect stops both loops and releases the source in one step.
    CancelRegistration registration = cancel.on_cancel([this, &frames]() {
        cancelled_ = true;
        stop_heartbeat();
        frames.close();
    });

    auto release = [&](State final_state) {
        state_ = final_state;
        registration.reset();
        frames.close();
    };

    std::exception_ptr failure;
    try {
        while (auto frame = frames.next()) {
            write_frame(*frame);
        }
    } catch (const std::exception&) {
        // Rethrown below, once the heartbeat thread has been joined.
        failure = std::current_exception();
    }

    stop_heartbeat();
    if (heartbeat.joinable()) heartbeat.join();
    if (!failure) failure = heartbeat_error_;

    if (failure) {
        release(State::Aborted);
        std::rethrow_exception(failure);
    }
    if (cancelled_.load()) {
        release(State::Aborted);
        return StreamOutcome::Cancelled;
    }

    state_ = State::Completing;
    try {
        write_frame(frames.terminal());
    } catch (const std::exception&) {
        release(State::Aborted);
        throw;
    }
    release(State::Completing);
    return StreamOutcome::Completed;
}

void SSEWriter::write_frame(const Frame& frame) {
    std::optional<int64_t> id;
    std::optional<int64_t> retry;
    if (frame.error && options_.max_retries > 0) {
        retry = frame.retry_after_ms ? *frame.retry_after_ms : options_.retry_hint_ms;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (heartbeat_error_) std::rethrow_exception(heartbeat_error_);
    if (options_.include_id) id = next_id_++;
    buffer_.append(format_sse_event(frame.event, frame.data, id, retry));
    if (options_.flush_after_write) buffer_.flush();
    ++frames_sent_;
}

void SSEWriter::heartbeat_loop(FrameSource& frames) {
    const std::string comment = format_sse_comment("keep-alive");
    std::unique_lock<std::mutex> lock(heartbeat_mutex_);
    while (!heartbeat_stop_) {
        if (heartbeat_cv_.wait_for(lock, options_.heartbeat_interval,
                                   [this] { return heartbeat_stop_; })) {
            break;
        }
        lock.unlock();
        try {
            std::lock_guard<std::mutex> write_lock(write_mutex_);
            if (state_.load() != State::Streaming) return;
            buffer_.append(comment);
            buffer_.flush();
            ++heartbeats_;
        } catch (const TransportError& e) {
            std::cerr << "[sse] Heartbeat write failed: " << e.what() << '\n';
            {
                std::lock_guard<std::mutex> write_lock(write_mutex_);
                heartbeat_error_ = std::current_exception();
            }
            state_ = State::Aborted;
            frames.close();
            return;
        }
        lock.lock();
    }
}

void SSEWriter::stop_heartbeat() {
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        heartbeat_stop_ = true;
    }
    heartbeat_cv_.notify_all();
}

} // namespace gaistream
