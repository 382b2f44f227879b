#include "sse.hpp"

namespace gaistream {

std::string format_sse_event(const std::string& event, const std::string& data,
                             std::optional<int64_t> id,
                             std::optional<int64_t> retry_ms) {
    std::string out;
    out.reserve(data.size() + event.size() + 32);
    if (id) out += "id: " + std::to_string(*id) + "\n";
    if (!event.empty()) out += "event: " + event + "\n";
    if (retry_ms) out += "retry: " + std::to_string(*retry_ms) + "\n";

    size_t pos = 0;
    while (true) {
        size_t newline = data.find('\n', pos);
        out += "data: ";
        out.append(data, pos, newline == std::string::npos ? std::string::npos : newline - pos);
        out += '\n';
        if (newline == std::string::npos) break;
        pos = newline + 1;
    }
    out += '\n';
    return out;
}

std::string format_sse_comment(const std::string& text) {
    return ": " + text + "\n\n";
}

void SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break; // incomplete line stays buffered

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            // Empty line = dispatch event
            if (has_data_) {
                SSEEvent event = std::move(current_);
                current_ = SSEEvent{};
                has_data_ = false;
                if (!callback(event)) {
                    buffer_ = buffer_.substr(pos);
                    return;
                }
            }
            current_ = SSEEvent{};
        } else if (line[0] == ':') {
            ++comments_;
        } else if (line.rfind("event:", 0) == 0) {
            current_.event = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
        } else if (line.rfind("data:", 0) == 0) {
            if (has_data_) current_.data += '\n';
            // Handle both "data: payload" (with space) and "data:payload" (without)
            current_.data += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
            has_data_ = true;
        } else if (line.rfind("id:", 0) == 0) {
            current_.id = line.substr(line.size() > 3 && line[3] == ' ' ? 4 : 3);
        } else if (line.rfind("retry:", 0) == 0) {
            try {
                current_.retry_ms = std::stoll(line.substr(6));
            } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
            }
        }
    }

    buffer_ = buffer_.substr(pos);
}

void SSEParser::reset() {
    buffer_.clear();
    current_ = SSEEvent{};
    has_data_ = false;
    comments_ = 0;
}

} // namespace gaistream
