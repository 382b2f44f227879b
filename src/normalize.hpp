#pragma once
#include "event.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gaistream {

// Wire format version. Changing any serialized field is a breaking change.
constexpr const char* kSchemaVersion = "gai.events.v1";

// ── Normalized event types ──────────────────────────────────────

namespace event_types {
    constexpr const char* Start      = "start";
    constexpr const char* Finish     = "finish";
    constexpr const char* Error      = "error";
    constexpr const char* TextDelta  = "text.delta";
    constexpr const char* AudioDelta = "audio.delta";
    constexpr const char* ToolCall   = "tool.call";
    constexpr const char* ToolResult = "tool.result";
    constexpr const char* Citations  = "citations";
    constexpr const char* Safety     = "safety";
    constexpr const char* StepEnd    = "step.end";
    constexpr const char* RawPrefix  = "raw.";
} // namespace event_types

struct AudioData {
    std::string chunk; // raw bytes, base64 on the wire
    std::string format;
};

struct ToolCallData {
    std::string name;
    std::string input; // raw JSON text
};

struct CitationData {
    std::string uri;
    std::string title;
    int start = 0;
    int end = 0;
};

struct SafetyData {
    std::string category;
    std::string action;
    double score = 0.0;
};

struct UsageData {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t total_tokens = 0;
};

struct ErrorData {
    std::string code;
    std::string message;
    bool retryable = false;
    int64_t retry_after_ms = 0; // 0 = no hint
};

// Provider-independent, versioned event record. Created once per source
// event by a Normalizer and consumed once by a protocol writer.
struct NormalizedEvent {
    std::string schema;
    std::string type;
    int64_t ts = 0;   // unix millis
    int64_t seq = 0;  // 1-based, per stream
    std::string trace_id;
    std::string request_id;
    int step = 0;
    std::string call_id;
    std::string provider; // start/finish only
    std::string model;    // start/finish only

    std::string text;
    std::optional<AudioData> audio;
    std::optional<ToolCallData> tool_call;
    nlohmann::json tool_result; // null when absent
    std::vector<CitationData> citations;
    std::optional<SafetyData> safety;
    std::optional<UsageData> usage;
    std::string finish_reason;
    std::optional<ErrorData> error;

    bool is(const char* event_type) const { return type == event_type; }

    // Minimal wire object: schema/provider/model only on start, no seq on finish.
    nlohmann::ordered_json compact() const;
    std::string compact_json() const;
};

// Serialize for the wire. Invalid UTF-8 from a provider is replaced with
// U+FFFD instead of throwing.
std::string dump_wire(const nlohmann::ordered_json& j);
std::string dump_wire(const nlohmann::json& j);

// Full record, every non-empty field, fixed field order.
nlohmann::ordered_json normalized_to_json(const NormalizedEvent& event);

// Accepts both the full record and the compact form.
NormalizedEvent normalized_from_json(const nlohmann::json& j);

// Parse JSON text. Throws std::invalid_argument on malformed input.
NormalizedEvent parse_normalized_event(const std::string& text);

// Throws SchemaError if a start event carries a foreign schema version.
// Non-start events are never schema-checked.
void validate_schema(const NormalizedEvent& event);

// Maps source events to the normalized wire format. One instance per stream;
// the sequence counter is only advanced by the single forwarding task.
class Normalizer {
public:
    Normalizer(std::string request_id, std::string trace_id);

    Normalizer& with_provider(std::string provider);
    Normalizer& with_model(std::string model);

    // Exactly one output per input. Never throws for any event content.
    NormalizedEvent normalize(const Event& event);

    int64_t sequence() const { return sequence_.load(); }
    const std::string& request_id() const { return request_id_; }
    const std::string& trace_id() const { return trace_id_; }

private:
    std::string schema_;
    std::string request_id_;
    std::string trace_id_;
    std::string provider_;
    std::string model_;
    std::atomic<int64_t> sequence_{0};
};

// Request ids of the form req_<unix-nanos>_<process-sequence>.
class RequestIdGenerator {
public:
    virtual ~RequestIdGenerator() = default;
    virtual std::string generate();
};

} // namespace gaistream
