#include "normalized_stream.hpp"
#include <iostream>

namespace gaistream {

NormalizedStream::NormalizedStream(SourceStream& source, Normalizer& normalizer,
                                   size_t capacity)
    : source_(source), normalizer_(normalizer), events_(capacity) {}

NormalizedStream::~NormalizedStream() {
    close();
    if (worker_.joinable()) worker_.join();
}

void NormalizedStream::start() {
    worker_ = std::thread([this]() { forward(); });
}

void NormalizedStream::forward() {
    try {
        while (!closed_.load()) {
            auto event = source_.next();
            if (!event) break;
            if (!events_.push(normalizer_.normalize(*event))) return;
        }
    } catch (const std::exception& e) {
        // Source failures are delivered in-band, then the stream ends.
        std::cerr << "[pipeline] Source stream failed: " << e.what() << '\n';
        if (!events_.push(normalizer_.normalize(make_error(std::current_exception())))) return;
    }
    events_.close();
}

std::optional<NormalizedEvent> NormalizedStream::next() {
    return events_.pop();
}

void NormalizedStream::close() {
    if (closed_.exchange(true)) return;
    events_.close_and_clear();
    source_.close();
}

} // namespace gaistream
