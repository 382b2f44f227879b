#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gaistream {

// Source-side generation events, as yielded by a provider stream.
// The payload is a closed variant: adding a kind is a compile-time change
// in every std::visit over EventPayload.

struct AudioFormat {
    std::string mime;
    int sample_rate = 0;
    int channels = 0;
    int bit_depth = 0;
};

struct Citation {
    std::string uri;
    std::string title;
    int start = 0;
    int end = 0;
};

struct TokenUsage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t total_tokens = 0;
};

// ── Event payloads ──────────────────────────────────────────────

struct StartEvent {};

struct TextDeltaEvent {
    std::string text;
};

struct AudioDeltaEvent {
    std::string chunk; // raw bytes
    std::optional<AudioFormat> format;
};

struct ToolCallEvent {
    std::string id;
    std::string name;
    std::string input; // raw JSON
};

struct ToolResultEvent {
    std::string id;
    std::string name;
    nlohmann::json result;
};

struct CitationsEvent {
    std::vector<Citation> citations;
};

struct SafetyEvent {
    std::string category;
    std::string action; // "block", "warn", "pass"
    double score = 0.0;
    std::string note;
};

struct StepFinishEvent {
    int step = 0;
};

struct FinishEvent {
    std::optional<TokenUsage> usage;
    std::string finish_reason;
};

struct ErrorEvent {
    std::exception_ptr error;
};

// Provider-specific data that has no normalized counterpart.
struct RawEvent {
    int kind = 10; // variant ordinal unless the provider reports its own
    nlohmann::json data;
};

using EventPayload = std::variant<
    StartEvent,
    TextDeltaEvent,
    AudioDeltaEvent,
    ToolCallEvent,
    ToolResultEvent,
    CitationsEvent,
    SafetyEvent,
    StepFinishEvent,
    FinishEvent,
    ErrorEvent,
    RawEvent>;

struct Event {
    EventPayload payload;
    std::chrono::system_clock::time_point timestamp;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(payload); }

    template<typename T>
    const T& as() const { return std::get<T>(payload); }
};

// Visitor helper for std::visit over EventPayload
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Stable snake-case name of the event kind ("text_delta", "finish", ...)
const char* event_kind_name(const Event& event);

// Numeric kind (variant index); RawEvent reports its own kind
int event_kind_number(const Event& event);

// Millisecond timestamp of an event
int64_t event_millis(const Event& event);

// ── Constructors (stamp the current time) ───────────────────────

Event make_event(EventPayload payload);
Event make_start();
Event make_text_delta(std::string text);
Event make_tool_call(std::string id, std::string name, std::string input);
Event make_tool_result(std::string id, std::string name, nlohmann::json result);
Event make_finish(std::optional<TokenUsage> usage = std::nullopt,
                  std::string finish_reason = "");
Event make_error(std::exception_ptr error);

// Convenience: wrap an exception object into an error event
template<typename E>
Event make_error_from(E error) {
    return make_error(std::make_exception_ptr(std::move(error)));
}

} // namespace gaistream
