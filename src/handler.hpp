#pragma once
#include "cancel.hpp"
#include "frames.hpp"
#include "ndjson_writer.hpp"
#include "normalize.hpp"
#include "provider.hpp"
#include "response.hpp"
#include "sse_writer.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace gaistream {

enum class StreamMode { Normalized, Passthrough };

inline const char* stream_mode_name(StreamMode mode) {
    switch (mode) {
        case StreamMode::Normalized: return "normalized";
        case StreamMode::Passthrough: return "passthrough";
    }
    return "normalized";
}

// Per-request stream metadata produced by request preparation.
struct StreamConfig {
    std::optional<StreamMode> mode; // unset: decided from the request hints
    std::string request_id;
    std::string trace_id;
    std::string provider;
    std::string model;
};

struct PreparedRequest {
    GenerateRequest request;
    StreamConfig config;
};

// Turns an inbound HTTP request into a provider request. Throws
// std::invalid_argument for malformed input (reported as 400).
using PrepareFn = std::function<PreparedRequest(const HttpRequest&)>;

// Accept header first, then path hints; SSE when nothing matches.
Transport detect_format(const HttpRequest& req);

// Explicit mode, then ?mode=, then the /chat/completions path; else normalized.
StreamMode resolve_mode(const HttpRequest& req, const StreamConfig& config);

// OpenAI chat.completions body; passthrough mode.
PreparedRequest prepare_openai_request(const HttpRequest& req);

// {model, messages | prompt, request_id?, trace_id?}; mode from the hints.
PreparedRequest prepare_generic_request(const HttpRequest& req);

// How serve() ended.
enum class ServeResult {
    Completed, // terminal frame written
    Cancelled, // client went away, resources released
    Failed,    // stream broke off after headers were committed
    Rejected   // error status sent before streaming began
};

// Wires one request: provider stream -> (normalizer + pipeline) -> writer.
class StreamHandler {
public:
    StreamHandler(StreamProvider& provider, PrepareFn prepare,
                  SSEOptions sse = {}, NDJSONOptions ndjson = {},
                  size_t queue_capacity = kDefaultQueueCapacity);

    ServeResult serve(const HttpRequest& req, ResponseWriter& out,
                      const CancelToken& cancel = {});

    void set_id_generator(std::shared_ptr<RequestIdGenerator> generator);

private:
    ServeResult run(FrameSource& frames, Transport transport, ResponseWriter& out,
                    const CancelToken& cancel, const std::string& request_id);

    StreamProvider& provider_;
    PrepareFn prepare_;
    SSEOptions sse_;
    NDJSONOptions ndjson_;
    size_t queue_capacity_;
    std::shared_ptr<RequestIdGenerator> ids_;
};

} // namespace gaistream
