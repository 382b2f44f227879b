#include "handler.hpp"
#include "error.hpp"
#include "normalized_stream.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace gaistream {

// ── Negotiation ─────────────────────────────────────────────────

Transport detect_format(const HttpRequest& req) {
    std::string accept = to_lower(req.header("accept"));
    if (contains(accept, "text/event-stream")) return Transport::SSE;
    if (contains(accept, "application/x-ndjson") || contains(accept, "application/json")) {
        return Transport::NDJSON;
    }

    if (contains(req.path, "/events") || contains(req.path, "/sse")) return Transport::SSE;
    if (contains(req.path, "/ndjson")) return Transport::NDJSON;
    return Transport::SSE;
}

StreamMode resolve_mode(const HttpRequest& req, const StreamConfig& config) {
    if (config.mode) return *config.mode;

    std::string hint = to_lower(req.query_param("mode"));
    if (hint == "passthrough") return StreamMode::Passthrough;
    if (hint == "normalized") return StreamMode::Normalized;

    if (contains(req.path, "/chat/completions")) return StreamMode::Passthrough;
    return StreamMode::Normalized;
}

// ── Request preparation ─────────────────────────────────────────

namespace {

json parse_body(const HttpRequest& req) {
    if (trim(req.body).empty()) throw std::invalid_argument("request body is empty");
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("invalid JSON body: ") + e.what());
    }
    if (!body.is_object()) throw std::invalid_argument("request body must be a JSON object");
    return body;
}

// Content is a string or an array of {type:"text", text} parts.
std::string message_content(const json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (content.is_null()) return "";
    if (!content.is_array()) throw std::invalid_argument("message content must be a string or array");

    std::string text;
    for (const auto& part : content) {
        if (part.is_object() && part.value("type", "") == "text") {
            text += part.value("text", "");
        }
    }
    return text;
}

std::vector<ChatMessage> parse_messages(const json& messages) {
    if (!messages.is_array()) throw std::invalid_argument("messages must be an array");
    std::vector<ChatMessage> out;
    out.reserve(messages.size());
    for (const auto& m : messages) {
        if (!m.is_object() || !m.contains("role")) {
            throw std::invalid_argument("each message needs a role");
        }
        ChatMessage msg;
        msg.role = role_from_string(m["role"].get<std::string>());
        msg.content = message_content(m.value("content", json()));
        out.push_back(std::move(msg));
    }
    return out;
}

} // namespace

PreparedRequest prepare_openai_request(const HttpRequest& req) {
    json body = parse_body(req);

    PreparedRequest prepared;
    try {
        prepared.request.model = body.value("model", "");
        prepared.request.messages = parse_messages(body.value("messages", json::array()));
        if (body.contains("temperature") && body["temperature"].is_number()) {
            prepared.request.temperature = body["temperature"].get<double>();
        }
        if (body.contains("max_tokens") && body["max_tokens"].is_number_integer()) {
            prepared.request.max_tokens = body["max_tokens"].get<int>();
        }
        prepared.request.stream = body.value("stream", false);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("malformed request: ") + e.what());
    }
    if (prepared.request.messages.empty()) throw std::invalid_argument("messages must not be empty");

    prepared.request.idempotency_key = req.header("x-idempotency-key");
    if (prepared.request.idempotency_key.empty()) {
        prepared.request.idempotency_key = req.header("idempotency-key");
    }

    prepared.config.mode = StreamMode::Passthrough;
    prepared.config.model = prepared.request.model;
    prepared.config.trace_id = req.header("x-trace-id");
    return prepared;
}

PreparedRequest prepare_generic_request(const HttpRequest& req) {
    json body = parse_body(req);

    PreparedRequest prepared;
    try {
        prepared.request.model = body.value("model", "");
        if (body.contains("messages")) {
            prepared.request.messages = parse_messages(body["messages"]);
        } else if (body.contains("prompt")) {
            ChatMessage msg;
            msg.content = body["prompt"].get<std::string>();
            prepared.request.messages.push_back(std::move(msg));
        }
        if (body.contains("temperature") && body["temperature"].is_number()) {
            prepared.request.temperature = body["temperature"].get<double>();
        }
        if (body.contains("max_tokens") && body["max_tokens"].is_number_integer()) {
            prepared.request.max_tokens = body["max_tokens"].get<int>();
        }
        prepared.request.request_id = body.value("request_id", "");
        prepared.config.trace_id = body.value("trace_id", "");
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("malformed request: ") + e.what());
    }
    if (prepared.request.messages.empty()) {
        throw std::invalid_argument("either messages or prompt is required");
    }

    if (prepared.request.request_id.empty()) {
        prepared.request.request_id = req.header("x-request-id");
    }
    if (prepared.config.trace_id.empty()) {
        prepared.config.trace_id = req.header("x-trace-id");
    }
    prepared.config.model = prepared.request.model;
    return prepared;
}

// ── StreamHandler ───────────────────────────────────────────────

namespace {

// Closes the source stream on every exit path.
class SourceGuard {
public:
    explicit SourceGuard(SourceStream& source) : source_(source) {}
    ~SourceGuard() { source_.close(); }

    SourceGuard(const SourceGuard&) = delete;
    SourceGuard& operator=(const SourceGuard&) = delete;

private:
    SourceStream& source_;
};

} // namespace

StreamHandler::StreamHandler(StreamProvider& provider, PrepareFn prepare,
                             SSEOptions sse, NDJSONOptions ndjson,
                             size_t queue_capacity)
    : provider_(provider),
      prepare_(std::move(prepare)),
      sse_(sse),
      ndjson_(ndjson),
      queue_capacity_(queue_capacity),
      ids_(std::make_shared<RequestIdGenerator>()) {}

void StreamHandler::set_id_generator(std::shared_ptr<RequestIdGenerator> generator) {
    if (generator) ids_ = std::move(generator);
}

ServeResult StreamHandler::serve(const HttpRequest& req, ResponseWriter& out,
                                 const CancelToken& cancel) {
    PreparedRequest prepared;
    try {
        prepared = prepare_(req);
    } catch (const std::invalid_argument& e) {
        out.send_error(400, e.what());
        return ServeResult::Rejected;
    }

    GenerateRequest& request = prepared.request;
    StreamConfig& config = prepared.config;
    request.stream = true;
    if (request.request_id.empty()) request.request_id = ids_->generate();
    config.request_id = request.request_id;
    if (config.model.empty()) config.model = request.model;
    if (config.provider.empty()) config.provider = provider_.provider_name();

    std::unique_ptr<SourceStream> source;
    try {
        source = provider_.stream_text(request, cancel);
    } catch (const std::exception& e) {
        std::cerr << "[handler] Failed to open stream for " << config.request_id
                  << ": " << e.what() << '\n';
        out.send_error(500, e.what());
        return ServeResult::Rejected;
    }
    if (!source) {
        out.send_error(500, "provider returned no stream");
        return ServeResult::Rejected;
    }
    SourceGuard guard(*source);

    Transport transport = detect_format(req);
    StreamMode mode = resolve_mode(req, config);

    if (mode == StreamMode::Passthrough) {
        PassthroughFrames frames(*source, transport);
        ServeResult result = run(frames, transport, out, cancel, config.request_id);
        if (frames.dropped() > 0) {
            std::cerr << "[passthrough] Skipped " << frames.dropped()
                      << " unmappable events for " << config.request_id << '\n';
        }
        return result;
    }

    Normalizer normalizer(config.request_id, config.trace_id);
    normalizer.with_provider(config.provider).with_model(config.model);
    NormalizedStream pipeline(*source, normalizer, queue_capacity_);
    pipeline.start();
    NormalizedFrames frames(pipeline, transport, ndjson_.compact_json, ndjson_.include_timestamp);
    return run(frames, transport, out, cancel, config.request_id);
}

ServeResult StreamHandler::run(FrameSource& frames, Transport transport, ResponseWriter& out,
                               const CancelToken& cancel, const std::string& request_id) {
    try {
        StreamOutcome outcome;
        if (transport == Transport::SSE) {
            SSEWriter writer(out, sse_);
            outcome = writer.stream(frames, cancel);
        } else {
            NDJSONWriter writer(out, ndjson_);
            outcome = writer.stream(frames, cancel);
        }
        return outcome == StreamOutcome::Completed ? ServeResult::Completed
                                                   : ServeResult::Cancelled;
    } catch (const TransportError& e) {
        // Headers are already on the wire; nothing more can be sent.
        std::cerr << "[handler] " << transport_name(transport) << " stream " << request_id
                  << " aborted: " << e.what() << '\n';
        return ServeResult::Failed;
    } catch (const std::exception& e) {
        std::cerr << "[handler] " << transport_name(transport) << " stream " << request_id
                  << " failed: " << e.what() << '\n';
        return ServeResult::Failed;
    }
}

} // namespace gaistream
