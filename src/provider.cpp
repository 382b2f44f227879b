#include "provider.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

namespace gaistream {

Role role_from_string(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "system") return Role::System;
    if (lower == "user") return Role::User;
    if (lower == "assistant") return Role::Assistant;
    if (lower == "tool") return Role::Tool;
    throw std::invalid_argument("Unknown message role: " + name);
}

ProviderRegistry& ProviderRegistry::instance() {
    static ProviderRegistry registry;
    return registry;
}

void ProviderRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

std::unique_ptr<StreamProvider> ProviderRegistry::create(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        throw std::invalid_argument("Unknown provider: " + name);
    }
    return it->second();
}

std::vector<std::string> ProviderRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool ProviderRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

std::unique_ptr<StreamProvider> create_provider(const std::string& name) {
    return ProviderRegistry::instance().create(name);
}

} // namespace gaistream
