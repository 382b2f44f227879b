#include "event.hpp"

namespace gaistream {

const char* event_kind_name(const Event& event) {
    return std::visit(overloaded{
        [](const StartEvent&)      { return "start"; },
        [](const TextDeltaEvent&)  { return "text_delta"; },
        [](const AudioDeltaEvent&) { return "audio_delta"; },
        [](const ToolCallEvent&)   { return "tool_call"; },
        [](const ToolResultEvent&) { return "tool_result"; },
        [](const CitationsEvent&)  { return "citations"; },
        [](const SafetyEvent&)     { return "safety"; },
        [](const StepFinishEvent&) { return "finish_step"; },
        [](const FinishEvent&)     { return "finish"; },
        [](const ErrorEvent&)      { return "error"; },
        [](const RawEvent&)        { return "raw"; },
    }, event.payload);
}

int event_kind_number(const Event& event) {
    if (auto* raw = std::get_if<RawEvent>(&event.payload)) {
        return raw->kind;
    }
    return static_cast<int>(event.payload.index());
}

int64_t event_millis(const Event& event) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        event.timestamp.time_since_epoch()).count();
}

Event make_event(EventPayload payload) {
    return Event{std::move(payload), std::chrono::system_clock::now()};
}

Event make_start() {
    return make_event(StartEvent{});
}

Event make_text_delta(std::string text) {
    return make_event(TextDeltaEvent{std::move(text)});
}

Event make_tool_call(std::string id, std::string name, std::string input) {
    return make_event(ToolCallEvent{std::move(id), std::move(name), std::move(input)});
}

Event make_tool_result(std::string id, std::string name, nlohmann::json result) {
    return make_event(ToolResultEvent{std::move(id), std::move(name), std::move(result)});
}

Event make_finish(std::optional<TokenUsage> usage, std::string finish_reason) {
    return make_event(FinishEvent{usage, std::move(finish_reason)});
}

Event make_error(std::exception_ptr error) {
    return make_event(ErrorEvent{std::move(error)});
}

} // namespace gaistream
