#include "cancel.hpp"
#include <algorithm>
#include <thread>

namespace gaistream {

namespace detail {

uint64_t CancelState::add(std::function<void()> cb) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!cancelled.load(std::memory_order_acquire)) {
            uint64_t id = next_id++;
            callbacks.emplace_back(id, std::move(cb));
            return id;
        }
    }
    cb();
    return 0;
}

void CancelState::remove(uint64_t id) {
    std::unique_lock<std::mutex> lock(mutex);
    callbacks.erase(
        std::remove_if(callbacks.begin(), callbacks.end(),
                       [id](const auto& p) { return p.first == id; }),
        callbacks.end());
    // A callback in flight on another thread must finish before its owner
    // goes away.
    cv.wait(lock, [&] {
        return running != id || invoker == std::this_thread::get_id();
    });
}

void CancelState::trigger() {
    std::unique_lock<std::mutex> lock(mutex);
    if (cancelled.exchange(true, std::memory_order_acq_rel)) return;
    invoker = std::this_thread::get_id();
    cv.notify_all();
    // Invoke outside the lock: callbacks may register or unregister.
    while (!callbacks.empty()) {
        auto [id, cb] = std::move(callbacks.front());
        callbacks.erase(callbacks.begin());
        running = id;
        lock.unlock();
        cb();
        lock.lock();
        running = 0;
        cv.notify_all();
    }
}

} // namespace detail

CancelRegistration::CancelRegistration(CancelRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancelRegistration& CancelRegistration::operator=(CancelRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancelRegistration::reset() {
    if (state_ && id_ != 0) {
        state_->remove(id_);
    }
    state_.reset();
    id_ = 0;
}

CancelRegistration CancelToken::on_cancel(std::function<void()> cb) const {
    if (!state_) return {};
    uint64_t id = state_->add(std::move(cb));
    if (id == 0) return {};
    return CancelRegistration(state_, id);
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

} // namespace gaistream
