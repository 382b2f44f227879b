#pragma once
#include "event.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>

namespace gaistream {

// Maps source events onto the OpenAI chat.completion.chunk streaming shape.
//
// Mapped kinds: text delta, tool call, finish. Every other kind yields
// nullopt and is skipped by the writers; the converter counts the drops.
class PassthroughConverter {
public:
    std::optional<nlohmann::ordered_json> convert(const Event& event);

    size_t converted() const { return converted_; }
    size_t dropped() const { return dropped_; }

private:
    size_t converted_ = 0;
    size_t dropped_ = 0;
};

// Stateless form of PassthroughConverter::convert.
std::optional<nlohmann::ordered_json> convert_to_openai(const Event& event);

} // namespace gaistream
