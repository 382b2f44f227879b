#include "passthrough.hpp"

using ojson = nlohmann::ordered_json;

namespace gaistream {

static ojson chunk_with_choice(ojson choice) {
    ojson chunk;
    chunk["object"] = "chat.completion.chunk";
    chunk["choices"] = ojson::array({std::move(choice)});
    return chunk;
}

std::optional<ojson> convert_to_openai(const Event& event) {
    return std::visit(overloaded{
        [](const TextDeltaEvent& e) -> std::optional<ojson> {
            ojson choice;
            choice["index"] = 0;
            choice["delta"] = {{"content", e.text}};
            return chunk_with_choice(std::move(choice));
        },
        [](const ToolCallEvent& e) -> std::optional<ojson> {
            ojson call;
            call["id"] = e.id;
            call["type"] = "function";
            call["function"] = {{"name", e.name}, {"arguments", e.input}};

            ojson choice;
            choice["index"] = 0;
            choice["delta"] = {{"tool_calls", ojson::array({std::move(call)})}};
            return chunk_with_choice(std::move(choice));
        },
        [](const FinishEvent& e) -> std::optional<ojson> {
            ojson choice;
            choice["index"] = 0;
            choice["finish_reason"] = e.finish_reason.empty() ? "stop" : e.finish_reason;

            ojson usage = ojson::object();
            if (e.usage) {
                usage["prompt_tokens"] = e.usage->input_tokens;
                usage["completion_tokens"] = e.usage->output_tokens;
                usage["total_tokens"] = e.usage->total_tokens;
            }

            ojson chunk = chunk_with_choice(std::move(choice));
            chunk["usage"] = std::move(usage);
            return chunk;
        },
        [](const StartEvent&)      -> std::optional<ojson> { return std::nullopt; },
        [](const AudioDeltaEvent&) -> std::optional<ojson> { return std::nullopt; },
        [](const ToolResultEvent&) -> std::optional<ojson> { return std::nullopt; },
        [](const CitationsEvent&)  -> std::optional<ojson> { return std::nullopt; },
        [](const SafetyEvent&)     -> std::optional<ojson> { return std::nullopt; },
        [](const StepFinishEvent&) -> std::optional<ojson> { return std::nullopt; },
        [](const ErrorEvent&)      -> std::optional<ojson> { return std::nullopt; },
        [](const RawEvent&)        -> std::optional<ojson> { return std::nullopt; },
    }, event.payload);
}

std::optional<ojson> PassthroughConverter::convert(const Event& event) {
    auto chunk = convert_to_openai(event);
    if (chunk) {
        ++converted_;
    } else {
        ++dropped_;
    }
    return chunk;
}

} // namespace gaistream
