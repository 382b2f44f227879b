#include "echo.hpp"
#include "../util.hpp"
#include <thread>

namespace gaistream {

static ProviderRegistrar reg_echo("echo", []() { return std::make_unique<EchoProvider>(); });

namespace {

// Splits into words, keeping the trailing space on every word but the last.
std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    for (const auto& word : split(text, ' ')) {
        if (word.empty()) continue;
        words.push_back(word + " ");
    }
    if (!words.empty()) words.back().pop_back();
    return words;
}

class EchoStream : public SourceStream {
public:
    EchoStream(std::vector<std::string> words, int64_t prompt_tokens,
               std::chrono::milliseconds delay, CancelToken cancel)
        : words_(std::move(words)), prompt_tokens_(prompt_tokens),
          delay_(delay), cancel_(std::move(cancel)) {
        producer_ = std::thread([this]() { produce(); });
    }

    ~EchoStream() override {
        close();
        if (producer_.joinable()) producer_.join();
    }

    std::optional<Event> next() override { return channel_.next(); }
    void close() override { channel_.close(); }

private:
    void produce() {
        if (!channel_.emit(make_start())) return;
        for (const auto& word : words_) {
            if (delay_.count() > 0 && cancel_.wait_for(delay_)) break;
            if (cancel_.is_cancelled() || channel_.closed()) break;
            if (!channel_.emit(make_text_delta(word))) return;
        }
        if (!cancel_.is_cancelled()) {
            TokenUsage usage;
            usage.input_tokens = prompt_tokens_;
            usage.output_tokens = static_cast<int64_t>(words_.size());
            usage.total_tokens = usage.input_tokens + usage.output_tokens;
            if (!channel_.emit(make_finish(usage, "stop"))) return;
        }
        channel_.finish();
    }

    ChannelStream channel_;
    std::vector<std::string> words_;
    int64_t prompt_tokens_;
    std::chrono::milliseconds delay_;
    CancelToken cancel_;
    std::thread producer_;
};

} // namespace

EchoProvider::EchoProvider(std::chrono::milliseconds word_delay)
    : word_delay_(word_delay) {}

std::unique_ptr<SourceStream> EchoProvider::stream_text(const GenerateRequest& request,
                                                        const CancelToken& cancel) {
    std::string prompt;
    int64_t prompt_tokens = 0;
    for (const auto& msg : request.messages) {
        prompt_tokens += static_cast<int64_t>(split_words(msg.content).size());
        if (msg.role == Role::User) prompt = msg.content;
    }
    return std::make_unique<EchoStream>(split_words(prompt), prompt_tokens,
                                        word_delay_, cancel);
}

} // namespace gaistream
