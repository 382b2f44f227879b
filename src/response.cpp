#include "response.hpp"
#include "util.hpp"

namespace gaistream {

std::string HttpRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

ResponseBuffer::ResponseBuffer(ResponseWriter& out, size_t capacity)
    : out_(out), capacity_(capacity == 0 ? 1 : capacity) {
    buffer_.reserve(capacity_);
}

void ResponseBuffer::append(const std::string& s) {
    buffer_ += s;
    if (buffer_.size() >= capacity_) drain();
}

void ResponseBuffer::flush() {
    drain();
    out_.flush();
}

void ResponseBuffer::drain() {
    if (buffer_.empty()) return;
    std::string pending;
    pending.swap(buffer_);
    out_.write(pending);
}

std::vector<Header> streaming_headers(const std::string& content_type) {
    std::vector<Header> headers = {
        {"Content-Type", content_type},
        {"Cache-Control", "no-cache, no-store, must-revalidate"},
        {"Connection", "keep-alive"},
        {"X-Accel-Buffering", "no"},
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization, X-Idempotency-Key"},
    };
    return headers;
}

} // namespace gaistream
