#include "error.hpp"

namespace gaistream {

bool is_retryable_code(const std::string& code) {
    return code == error_codes::RateLimited ||
           code == error_codes::Timeout ||
           code == error_codes::ProviderUnavailable ||
           code == error_codes::Network;
}

const char* code_for_http_status(int status) {
    switch (status) {
        case 400: return error_codes::BadRequest;
        case 401: return error_codes::Unauthorized;
        case 403: return error_codes::Forbidden;
        case 404: return error_codes::NotFound;
        case 408: return error_codes::Timeout;
        case 413: return error_codes::ContextLength;
        case 429: return error_codes::RateLimited;
        case 502:
        case 503:
        case 504: return error_codes::ProviderUnavailable;
        default: break;
    }
    return error_codes::Internal;
}

static std::string describe(const std::string& code, const std::string& message) {
    return "(" + code + ") " + message;
}

ProviderError::ProviderError(std::string code, const std::string& message,
                             std::optional<int64_t> retry_after_ms)
    : std::runtime_error(describe(code, message)),
      code_(std::move(code)),
      message_(message),
      retryable_(is_retryable_code(code_)),
      retry_after_ms_(retry_after_ms) {}

ProviderError& ProviderError::with_retryable(bool retryable) {
    retryable_ = retryable;
    return *this;
}

} // namespace gaistream
