#pragma once
#include <stdexcept>
#include <string>
#include <optional>
#include <cstdint>

namespace gaistream {

// Wire error codes. Read-only; never extended at runtime.
namespace error_codes {
    constexpr const char* RateLimited        = "rate_limited";
    constexpr const char* ContextLength      = "context_length_exceeded";
    constexpr const char* ContentFiltered    = "content_filtered";
    constexpr const char* BadRequest         = "bad_request";
    constexpr const char* Unauthorized       = "unauthorized";
    constexpr const char* Forbidden          = "forbidden";
    constexpr const char* NotFound           = "not_found";
    constexpr const char* Timeout            = "timeout";
    constexpr const char* ProviderUnavailable = "provider_unavailable";
    constexpr const char* Network            = "network";
    constexpr const char* Internal           = "internal";
} // namespace error_codes

// Default retryability of a wire error code.
bool is_retryable_code(const std::string& code);

// Map an upstream HTTP status to a wire error code.
const char* code_for_http_status(int status);

// Structured upstream provider failure. Delivered in-band as an error event.
class ProviderError : public std::runtime_error {
public:
    ProviderError(std::string code, const std::string& message,
                  std::optional<int64_t> retry_after_ms = std::nullopt);

    const std::string& code() const { return code_; }
    const std::string& message() const { return message_; }
    bool retryable() const { return retryable_; }
    std::optional<int64_t> retry_after_ms() const { return retry_after_ms_; }

    ProviderError& with_retryable(bool retryable);

private:
    std::string code_;
    std::string message_;
    bool retryable_;
    std::optional<int64_t> retry_after_ms_;
};

// Write or flush failure on an HTTP response (client gone, broken pipe).
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Wire schema validation failure.
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace gaistream
