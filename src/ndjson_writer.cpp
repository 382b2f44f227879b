#include "ndjson_writer.hpp"
#include "error.hpp"
#include "normalize.hpp"
#include <iostream>
#include <thread>

namespace gaistream {

NDJSONWriter::NDJSONWriter(ResponseWriter& out, NDJSONOptions options)
    : out_(out), options_(options), buffer_(out, options.buffer_size) {}

StreamOutcome NDJSONWriter::stream(FrameSource& frames, const CancelToken& cancel) {
    for (const auto& [name, value] : streaming_headers("application/x-ndjson")) {
        out_.set_header(name, value);
    }
    out_.set_header("Transfer-Encoding", "chunked");
    try {
        std::lock_guard<std::mutex> lock(write_mutex_);
        out_.commit(200);
        out_.flush();
    } catch (const TransportError&) {
        frames.close();
        throw;
    }

    std::thread timer;
    if (options_.flush_interval.count() > 0) {
        timer = std::thread([this, &frames]() { flush_loop(frames); });
    }

    CancelRegistration registration = cancel.on_cancel([this, &frames]() {
        cancelled_ = true;
        stop_flush_loop();
        frames.close();
    });

    std::exception_ptr failure;
    try {
        while (auto frame = frames.next()) {
            write_line(frame->data);
        }
    } catch (const std::exception&) {
        // Rethrown below, once the timer thread has been joined.
        failure = std::current_exception();
    }

    stop_flush_loop();
    if (timer.joinable()) timer.join();
    if (!failure) failure = flush_error_;

    auto release = [&]() {
        registration.reset();
        frames.close();
    };

    if (failure) {
        release();
        std::rethrow_exception(failure);
    }
    if (cancelled_.load()) {
        release();
        return StreamOutcome::Cancelled;
    }

    try {
        write_line(frames.terminal().data);
    } catch (const std::exception&) {
        release();
        throw;
    }
    release();
    return StreamOutcome::Completed;
}

void NDJSONWriter::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (flush_error_) std::rethrow_exception(flush_error_);
    buffer_.append(line + "\n");
    buffer_.flush();
    ++lines_;
}

void NDJSONWriter::flush_loop(FrameSource& frames) {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (!timer_stop_) {
        if (timer_cv_.wait_for(lock, options_.flush_interval,
                               [this] { return timer_stop_; })) {
            break;
        }
        lock.unlock();
        try {
            std::lock_guard<std::mutex> write_lock(write_mutex_);
            buffer_.flush();
            ++periodic_flushes_;
        } catch (const TransportError& e) {
            std::cerr << "[ndjson] Periodic flush failed: " << e.what() << '\n';
            {
                std::lock_guard<std::mutex> write_lock(write_mutex_);
                flush_error_ = std::current_exception();
            }
            frames.close();
            return;
        }
        lock.lock();
    }
}

void NDJSONWriter::stop_flush_loop() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_stop_ = true;
    }
    timer_cv_.notify_all();
}

// ── NDJSONReader ────────────────────────────────────────────────

void NDJSONReader::feed(const std::string& chunk, const LineCallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;
        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;
        if (!emit(std::move(line), callback)) break;
    }
    buffer_ = buffer_.substr(pos);
}

void NDJSONReader::finish(const LineCallback& callback) {
    std::string rest;
    rest.swap(buffer_);
    emit(std::move(rest), callback);
}

bool NDJSONReader::emit(std::string line, const LineCallback& callback) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) return true;

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("malformed NDJSON line: ") + e.what());
    }
    return callback(parsed);
}

// ── Line to event ───────────────────────────────────────────────

namespace {

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) return it->get<std::string>();
    return "";
}

int64_t int_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number()) return it->get<int64_t>();
    return 0;
}

} // namespace

Event ndjson_to_event(const nlohmann::json& line) {
    if (!line.is_object()) {
        RawEvent raw;
        raw.data = line;
        return make_event(std::move(raw));
    }

    const std::string type = string_field(line, "type");
    Event event;

    if (type == "start") {
        event = make_start();
    } else if (type == "text.delta" || type == "text_delta") {
        event = make_text_delta(string_field(line, "text"));
    } else if (type == "tool.call" || type == "tool_call") {
        std::string id = string_field(line, "call_id");
        if (id.empty()) id = string_field(line, "id");
        std::string input;
        auto it = line.find("input");
        if (it != line.end() && !it->is_null()) {
            input = it->is_string() ? it->get<std::string>() : dump_wire(*it);
        }
        event = make_tool_call(std::move(id), string_field(line, "name"), std::move(input));
    } else if (type == "step.end" || type == "finish_step") {
        event = make_event(StepFinishEvent{static_cast<int>(int_field(line, "step"))});
    } else if (type == "finish") {
        std::optional<TokenUsage> usage;
        auto it = line.find("usage");
        if (it != line.end() && it->is_object()) {
            TokenUsage u;
            u.input_tokens = int_field(*it, "input_tokens");
            u.output_tokens = int_field(*it, "output_tokens");
            u.total_tokens = int_field(*it, "total_tokens");
            usage = u;
        }
        event = make_finish(usage, string_field(line, "finish_reason"));
    } else if (type == "error") {
        // Without a code, an upstream HTTP "status" picks one.
        std::string code = string_field(line, "code");
        if (code.empty()) {
            int64_t status = int_field(line, "status");
            code = status > 0 ? code_for_http_status(static_cast<int>(status))
                              : error_codes::Internal;
        }
        std::string message = string_field(line, "message");
        if (message.empty()) message = string_field(line, "error");
        std::optional<int64_t> retry_after;
        if (int64_t ms = int_field(line, "retry_after_ms"); ms > 0) retry_after = ms;

        ProviderError error(code, message, retry_after);
        if (auto it = line.find("retryable"); it != line.end() && it->is_boolean()) {
            error.with_retryable(it->get<bool>());
        }
        event = make_error_from(std::move(error));
    } else {
        RawEvent raw;
        raw.data = line;
        event = make_event(std::move(raw));
    }

    // "timestamp" is unix seconds, "ts" unix millis
    if (auto it = line.find("timestamp"); it != line.end() && it->is_number()) {
        event.timestamp = std::chrono::system_clock::time_point(
            std::chrono::seconds(it->get<int64_t>()));
    } else if (auto ts = line.find("ts"); ts != line.end() && ts->is_number()) {
        event.timestamp = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(ts->get<int64_t>()));
    }
    return event;
}

// ── NDJSONSource ────────────────────────────────────────────────

NDJSONSource::NDJSONSource(ReadFn read) : read_(std::move(read)) {}

std::optional<Event> NDJSONSource::next() {
    while (pending_.empty() && !done_ && !closed_.load()) fill();
    if (closed_.load() || pending_.empty()) return std::nullopt;
    Event event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

void NDJSONSource::close() {
    closed_ = true;
}

void NDJSONSource::fill() {
    auto collect = [this](const nlohmann::json& line) {
        pending_.push_back(ndjson_to_event(line));
        return true;
    };
    try {
        std::string chunk;
        if (read_(chunk)) {
            reader_.feed(chunk, collect);
            return;
        }
        done_ = true;
        reader_.finish(collect);
    } catch (const std::exception& e) {
        std::cerr << "[ndjson] Source stream ended: " << e.what() << '\n';
        done_ = true;
        pending_.push_back(make_error(std::current_exception()));
    }
}

} // namespace gaistream
