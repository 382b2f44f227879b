#include "normalize.hpp"
#include "error.hpp"
#include "util.hpp"
#include <stdexcept>

using ojson = nlohmann::ordered_json;
using json = nlohmann::json;

namespace gaistream {

// ── Normalizer ──────────────────────────────────────────────────

Normalizer::Normalizer(std::string request_id, std::string trace_id)
    : schema_(kSchemaVersion),
      request_id_(std::move(request_id)),
      trace_id_(std::move(trace_id)) {}

Normalizer& Normalizer::with_provider(std::string provider) {
    provider_ = std::move(provider);
    return *this;
}

Normalizer& Normalizer::with_model(std::string model) {
    model_ = std::move(model);
    return *this;
}

static ErrorData error_data_from(const std::exception_ptr& error) {
    ErrorData data;
    data.code = error_codes::Internal;
    if (!error) {
        data.message = "unknown error";
        return data;
    }
    try {
        std::rethrow_exception(error);
    } catch (const ProviderError& e) {
        data.code = e.code();
        data.message = e.message();
        data.retryable = e.retryable();
        if (e.retry_after_ms()) data.retry_after_ms = *e.retry_after_ms();
    } catch (const std::exception& e) {
        data.message = e.what();
    } catch (...) {
        data.message = "unknown error";
    }
    return data;
}

NormalizedEvent Normalizer::normalize(const Event& event) {
    NormalizedEvent out;
    out.schema = schema_;
    out.ts = event_millis(event);
    out.seq = ++sequence_;
    out.trace_id = trace_id_;
    out.request_id = request_id_;

    std::visit(overloaded{
        [&](const StartEvent&) {
            out.type = event_types::Start;
            out.provider = provider_;
            out.model = model_;
        },
        [&](const TextDeltaEvent& e) {
            out.type = event_types::TextDelta;
            out.text = e.text;
        },
        [&](const AudioDeltaEvent& e) {
            out.type = event_types::AudioDelta;
            AudioData audio;
            audio.chunk = e.chunk;
            if (e.format) audio.format = e.format->mime;
            out.audio = std::move(audio);
        },
        [&](const ToolCallEvent& e) {
            out.type = event_types::ToolCall;
            out.call_id = e.id;
            out.tool_call = ToolCallData{e.name, e.input};
        },
        [&](const ToolResultEvent& e) {
            out.type = event_types::ToolResult;
            out.call_id = e.id;
            out.tool_result = e.result;
        },
        [&](const CitationsEvent& e) {
            out.type = event_types::Citations;
            out.citations.reserve(e.citations.size());
            for (const auto& c : e.citations) {
                out.citations.push_back(CitationData{c.uri, c.title, c.start, c.end});
            }
        },
        [&](const SafetyEvent& e) {
            out.type = event_types::Safety;
            out.safety = SafetyData{e.category, e.action, e.score};
        },
        [&](const StepFinishEvent& e) {
            out.type = event_types::StepEnd;
            out.step = e.step;
        },
        [&](const FinishEvent& e) {
            out.type = event_types::Finish;
            if (e.usage) {
                out.usage = UsageData{e.usage->input_tokens,
                                      e.usage->output_tokens,
                                      e.usage->total_tokens};
            }
            out.finish_reason = e.finish_reason;
            out.provider = provider_;
            out.model = model_;
        },
        [&](const ErrorEvent& e) {
            out.type = event_types::Error;
            out.error = error_data_from(e.error);
        },
        [&](const RawEvent& e) {
            out.type = std::string(event_types::RawPrefix) + std::to_string(e.kind);
        },
    }, event.payload);

    return out;
}

std::string RequestIdGenerator::generate() {
    static std::atomic<int64_t> request_seq{0};
    return "req_" + std::to_string(epoch_nanos()) + "_" +
           std::to_string(++request_seq);
}

// ── Serialization ───────────────────────────────────────────────

std::string dump_wire(const ojson& j) {
    return j.dump(-1, ' ', false, ojson::error_handler_t::replace);
}

std::string dump_wire(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Raw JSON input is emitted as parsed JSON; unparseable text is kept as a string.
static ojson raw_json_value(const std::string& raw) {
    if (raw.empty()) return nullptr;
    auto parsed = ojson::parse(raw, nullptr, false);
    if (parsed.is_discarded()) return raw;
    return parsed;
}

static ojson to_ordered(const json& value) {
    return ojson::parse(dump_wire(value));
}

static std::string raw_json_text(const json& value) {
    if (value.is_null()) return {};
    if (value.is_string()) return value.get<std::string>();
    return dump_wire(value);
}

static ojson audio_to_json(const AudioData& audio) {
    ojson j = ojson::object();
    if (!audio.chunk.empty()) j["chunk"] = base64_encode(audio.chunk);
    if (!audio.format.empty()) j["format"] = audio.format;
    return j;
}

static ojson citation_to_json(const CitationData& c) {
    ojson j = {{"uri", c.uri}};
    if (!c.title.empty()) j["title"] = c.title;
    if (c.start != 0) j["start"] = c.start;
    if (c.end != 0) j["end"] = c.end;
    return j;
}

static ojson safety_to_json(const SafetyData& s) {
    return {{"category", s.category}, {"action", s.action}, {"score", s.score}};
}

static ojson usage_to_json(const UsageData& u) {
    ojson j = {{"input_tokens", u.input_tokens}, {"output_tokens", u.output_tokens}};
    if (u.total_tokens != 0) j["total_tokens"] = u.total_tokens;
    return j;
}

static ojson error_to_json(const ErrorData& e) {
    ojson j = {{"code", e.code}, {"message", e.message}};
    if (e.retryable) j["retryable"] = true;
    if (e.retry_after_ms > 0) j["retry_after_ms"] = e.retry_after_ms;
    return j;
}

ojson NormalizedEvent::compact() const {
    ojson j = ojson::object();

    if (type == event_types::Start) {
        j["schema"] = schema;
        j["type"] = type;
        j["ts"] = ts;
        j["seq"] = seq;
        if (!trace_id.empty()) j["trace_id"] = trace_id;
        if (!request_id.empty()) j["request_id"] = request_id;
        if (!provider.empty()) j["provider"] = provider;
        if (!model.empty()) j["model"] = model;
        return j;
    }

    j["type"] = type;
    if (type != event_types::Finish) j["seq"] = seq;

    if (type == event_types::TextDelta) {
        j["text"] = text;
    } else if (type == event_types::AudioDelta) {
        if (audio) j["audio"] = audio_to_json(*audio);
    } else if (type == event_types::ToolCall) {
        j["call_id"] = call_id;
        j["name"] = tool_call ? tool_call->name : "";
        j["input"] = tool_call ? raw_json_value(tool_call->input) : ojson(nullptr);
    } else if (type == event_types::ToolResult) {
        j["call_id"] = call_id;
        j["output"] = to_ordered(tool_result);
    } else if (type == event_types::Citations) {
        ojson arr = ojson::array();
        for (const auto& c : citations) arr.push_back(citation_to_json(c));
        j["citations"] = std::move(arr);
    } else if (type == event_types::Safety) {
        if (safety) j["safety"] = safety_to_json(*safety);
    } else if (type == event_types::StepEnd) {
        j["step"] = step;
    } else if (type == event_types::Finish) {
        if (usage) j["usage"] = usage_to_json(*usage);
        if (!finish_reason.empty()) j["finish_reason"] = finish_reason;
    } else if (type == event_types::Error) {
        if (error) {
            j["code"] = error->code;
            j["message"] = error->message;
            if (error->retry_after_ms > 0) j["retry_after_ms"] = error->retry_after_ms;
        }
    }
    return j;
}

std::string NormalizedEvent::compact_json() const {
    return dump_wire(compact());
}

ojson normalized_to_json(const NormalizedEvent& e) {
    ojson j = ojson::object();
    j["schema"] = e.schema;
    j["type"] = e.type;
    j["ts"] = e.ts;
    if (e.seq != 0) j["seq"] = e.seq;
    if (!e.trace_id.empty()) j["trace_id"] = e.trace_id;
    if (!e.request_id.empty()) j["request_id"] = e.request_id;
    if (e.step != 0) j["step"] = e.step;
    if (!e.call_id.empty()) j["call_id"] = e.call_id;
    if (!e.provider.empty()) j["provider"] = e.provider;
    if (!e.model.empty()) j["model"] = e.model;
    if (!e.text.empty()) j["text"] = e.text;
    if (e.audio) j["audio"] = audio_to_json(*e.audio);
    if (e.tool_call) {
        j["tool_call"] = {{"name", e.tool_call->name},
                          {"input", raw_json_value(e.tool_call->input)}};
    }
    if (!e.tool_result.is_null()) j["tool_result"] = to_ordered(e.tool_result);
    if (!e.citations.empty()) {
        ojson arr = ojson::array();
        for (const auto& c : e.citations) arr.push_back(citation_to_json(c));
        j["citations"] = std::move(arr);
    }
    if (e.safety) j["safety"] = safety_to_json(*e.safety);
    if (e.usage) j["usage"] = usage_to_json(*e.usage);
    if (!e.finish_reason.empty()) j["finish_reason"] = e.finish_reason;
    if (e.error) j["error"] = error_to_json(*e.error);
    return j;
}

// ── Parsing ─────────────────────────────────────────────────────

static ErrorData error_from_json(const json& j) {
    ErrorData e;
    e.code = j.value("code", "");
    e.message = j.value("message", "");
    e.retryable = j.value("retryable", false);
    e.retry_after_ms = j.value("retry_after_ms", int64_t{0});
    return e;
}

static NormalizedEvent read_normalized(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("normalized event must be a JSON object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        throw std::invalid_argument("normalized event missing type");
    }

    NormalizedEvent e;
    e.schema = j.value("schema", "");
    e.type = j["type"].get<std::string>();
    e.ts = j.value("ts", int64_t{0});
    e.seq = j.value("seq", int64_t{0});
    e.trace_id = j.value("trace_id", "");
    e.request_id = j.value("request_id", "");
    e.step = j.value("step", 0);
    e.call_id = j.value("call_id", "");
    e.provider = j.value("provider", "");
    e.model = j.value("model", "");
    e.text = j.value("text", "");
    e.finish_reason = j.value("finish_reason", "");

    if (j.contains("audio") && j["audio"].is_object()) {
        AudioData audio;
        audio.format = j["audio"].value("format", "");
        std::string encoded = j["audio"].value("chunk", "");
        if (!base64_decode(encoded, audio.chunk)) {
            throw std::invalid_argument("normalized event has malformed audio chunk");
        }
        e.audio = std::move(audio);
    }

    if (j.contains("tool_call") && j["tool_call"].is_object()) {
        const auto& tc = j["tool_call"];
        e.tool_call = ToolCallData{tc.value("name", ""),
                                   raw_json_text(tc.value("input", json()))};
    } else if (e.type == event_types::ToolCall && j.contains("name")) {
        e.tool_call = ToolCallData{j.value("name", ""),
                                   raw_json_text(j.value("input", json()))};
    }

    if (j.contains("tool_result")) {
        e.tool_result = j["tool_result"];
    } else if (j.contains("output")) {
        e.tool_result = j["output"];
    }

    if (j.contains("citations") && j["citations"].is_array()) {
        for (const auto& c : j["citations"]) {
            e.citations.push_back(CitationData{c.value("uri", ""), c.value("title", ""),
                                               c.value("start", 0), c.value("end", 0)});
        }
    }

    if (j.contains("safety") && j["safety"].is_object()) {
        const auto& s = j["safety"];
        e.safety = SafetyData{s.value("category", ""), s.value("action", ""),
                              s.value("score", 0.0)};
    }

    if (j.contains("usage") && j["usage"].is_object()) {
        const auto& u = j["usage"];
        e.usage = UsageData{u.value("input_tokens", int64_t{0}),
                            u.value("output_tokens", int64_t{0}),
                            u.value("total_tokens", int64_t{0})};
    }

    if (j.contains("error") && j["error"].is_object()) {
        e.error = error_from_json(j["error"]);
    } else if (e.type == event_types::Error && j.contains("code")) {
        e.error = error_from_json(j);
    }

    return e;
}

NormalizedEvent normalized_from_json(const json& j) {
    try {
        return read_normalized(j);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("normalized event has a wrong-typed field: ") +
                                    e.what());
    }
}

NormalizedEvent parse_normalized_event(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw std::invalid_argument("failed to parse normalized event: malformed JSON");
    }
    return normalized_from_json(j);
}

void validate_schema(const NormalizedEvent& event) {
    if (event.type == event_types::Start && event.schema != kSchemaVersion) {
        throw SchemaError("unsupported schema version: " + event.schema +
                          " (expected " + kSchemaVersion + ")");
    }
}

} // namespace gaistream
