#include "errors.hpp"

#include <array>

#include "utils.hpp"

namespace {

bool contains_any(const std::string& haystack, const char* const* needles, std::size_t count) {
  for(std::size_t i = 0; i < count; ++i) {
    if(haystack.find(needles[i]) != std::string::npos) return true;
  }
  return false;
}

// Checked in order: a 403 rate limit reply from Drive mentions both "403" and "rate limit".
constexpr std::array<const char*, 7> kRateLimitMarkers = {
  "rate limit", "ratelimit", "rate_limit", "429", "too many requests",
  "userratelimitexceeded", "quota exceeded"
};

constexpr std::array<const char*, 9> kAuthMarkers = {
  "authentication", "oauth", "unauthorized", "401", "invalid_grant",
  "token expired", "403 forbidden", "permission denied", "couldn't fetch token"
};

constexpr std::array<const char*, 8> kTransientMarkers = {
  "timeout", "timed out", "connection reset", "connection refused",
  "temporarily", "503", "500 internal", "broken pipe"
};

} // namespace

const char* to_string(ErrorCategory category) {
  switch(category) {
    case ErrorCategory::RateLimit: return "rate_limit";
    case ErrorCategory::Transient: return "transient";
    case ErrorCategory::Auth: return "auth";
    case ErrorCategory::Integrity: return "integrity";
    case ErrorCategory::Configuration: return "configuration";
    case ErrorCategory::IO: return "io";
    case ErrorCategory::Cancelled: return "cancelled";
    case ErrorCategory::Other: return "other";
  }
  return "other";
}

ErrorCategory classify_backend_error(const std::string& message) {
  const std::string lowered = to_lower_copy(message);
  if(contains_any(lowered, kRateLimitMarkers.data(), kRateLimitMarkers.size())) {
    return ErrorCategory::RateLimit;
  }
  if(contains_any(lowered, kAuthMarkers.data(), kAuthMarkers.size())) {
    return ErrorCategory::Auth;
  }
  if(contains_any(lowered, kTransientMarkers.data(), kTransientMarkers.size())) {
    return ErrorCategory::Transient;
  }
  return ErrorCategory::Other;
}

bool is_chunk_retryable(ErrorCategory category) {
  switch(category) {
    case ErrorCategory::RateLimit:
    case ErrorCategory::Transient:
    case ErrorCategory::Other:
      return true;
    default:
      return false;
  }
}
