#pragma once
#include "../provider.hpp"
#include <chrono>

namespace gaistream {

// Demo provider: streams the last user message back one word at a time.
class EchoProvider : public StreamProvider {
public:
    explicit EchoProvider(std::chrono::milliseconds word_delay = std::chrono::milliseconds(20));

    std::unique_ptr<SourceStream> stream_text(const GenerateRequest& request,
                                              const CancelToken& cancel) override;

    std::string provider_name() const override { return "echo"; }

private:
    std::chrono::milliseconds word_delay_;
};

} // namespace gaistream
