#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace gaistream {

namespace detail {

struct CancelState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;
    uint64_t running = 0; // id of the callback being invoked
    std::thread::id invoker;

    // Returns 0 when already cancelled (callback ran inline).
    uint64_t add(std::function<void()> cb);
    void remove(uint64_t id);
    void trigger();
};

} // namespace detail

// Unregisters its callback on destruction.
class CancelRegistration {
public:
    CancelRegistration() = default;
    CancelRegistration(CancelRegistration&& other) noexcept;
    CancelRegistration& operator=(CancelRegistration&& other) noexcept;
    ~CancelRegistration() { reset(); }

    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

    void reset();

private:
    friend class CancelToken;
    CancelRegistration(std::shared_ptr<detail::CancelState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::CancelState> state_;
    uint64_t id_ = 0;
};

// Request-scoped cancellation signal. Cheap to copy; a default-constructed
// token is never cancelled.
class CancelToken {
public:
    CancelToken() = default;

    bool is_cancelled() const {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    // Run `cb` once on the cancelling thread. Runs inline if already cancelled.
    CancelRegistration on_cancel(std::function<void()> cb) const;

    // Sleep for `timeout` or until cancelled. Returns true if cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<detail::CancelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

class CancelSource {
public:
    CancelSource() : state_(std::make_shared<detail::CancelState>()) {}

    CancelToken token() const { return CancelToken(state_); }

    // Idempotent; callbacks run exactly once.
    void cancel() { state_->trigger(); }

    bool is_cancelled() const { return state_->cancelled.load(); }

private:
    std::shared_ptr<detail::CancelState> state_;
};

} // namespace gaistream
