#include "source_stream.hpp"

namespace gaistream {

ChannelStream::ChannelStream(size_t capacity)
    : queue_(capacity) {}

bool ChannelStream::emit(Event event) {
    if (closed_.load()) return false;
    return queue_.push(std::move(event));
}

void ChannelStream::finish() {
    queue_.close();
}

std::optional<Event> ChannelStream::next() {
    return queue_.pop();
}

void ChannelStream::close() {
    if (closed_.exchange(true)) return;
    queue_.close_and_clear();

    std::function<void()> hook;
    {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        hook = std::move(on_close_);
    }
    if (hook) hook();
}

void ChannelStream::set_on_close(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    on_close_ = std::move(hook);
}

} // namespace gaistream
