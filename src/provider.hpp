#pragma once
#include "cancel.hpp"
#include "source_stream.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gaistream {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

// Throws std::invalid_argument for an unknown role name.
Role role_from_string(const std::string& name);

struct ChatMessage {
    Role role = Role::User;
    std::string content;
};

// Upstream generation request as seen by a provider.
struct GenerateRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    bool stream = false;
    std::string request_id;
    std::string idempotency_key;
};

// Upstream generation provider. Opening a stream may throw (bad request,
// unreachable backend); failures after that arrive in-band as ErrorEvents.
class StreamProvider {
public:
    virtual ~StreamProvider() = default;

    // The returned stream stops producing once closed or once `cancel` fires.
    virtual std::unique_ptr<SourceStream> stream_text(const GenerateRequest& request,
                                                      const CancelToken& cancel) = 0;

    virtual std::string provider_name() const = 0;
};

// ── Registry ────────────────────────────────────────────────────

using ProviderFactory = std::function<std::unique_ptr<StreamProvider>()>;

// Central registry for self-registering providers. Thread-safe.
class ProviderRegistry {
public:
    static ProviderRegistry& instance();

    void register_provider(const std::string& name, ProviderFactory factory);

    // Throws std::invalid_argument for an unknown name.
    std::unique_ptr<StreamProvider> create(const std::string& name) const;

    std::vector<std::string> names() const;
    bool has(const std::string& name) const;

private:
    ProviderRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
};

// Used at file scope in each provider .cpp
struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        ProviderRegistry::instance().register_provider(name, std::move(factory));
    }
};

std::unique_ptr<StreamProvider> create_provider(const std::string& name);

} // namespace gaistream
