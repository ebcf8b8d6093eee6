#include "scheduler/gateway_error.h"

#include <array>
#include <cstddef>

namespace switchyard {

namespace {

struct ErrorCodeInfo {
  ErrorCode code;
  ErrorCategory category;
  const char *name;
};

// Indexed by the numeric value of ErrorCode; the static_assert below keeps
// the table in lock-step with the enum.
constexpr std::array<ErrorCodeInfo, 27> kErrorTable{{
    {ErrorCode::kOk, ErrorCategory::kNone, "ok"},
    {ErrorCode::kInvalidBackendConfig, ErrorCategory::kConfiguration,
     "invalid_backend_config"},
    {ErrorCode::kDuplicateBackend, ErrorCategory::kConfiguration,
     "duplicate_backend"},
    {ErrorCode::kBackendNotFound, ErrorCategory::kConfiguration,
     "backend_not_found"},
    {ErrorCode::kInvalidConfig, ErrorCategory::kConfiguration,
     "invalid_config"},
    {ErrorCode::kNoCapableBackend, ErrorCategory::kRouting,
     "no_capable_backend"},
    {ErrorCode::kContextLengthExceeded, ErrorCategory::kRouting,
     "context_length_exceeded"},
    {ErrorCode::kResidencyViolation, ErrorCategory::kRouting,
     "residency_violation"},
    {ErrorCode::kAllBackendsUnhealthy, ErrorCategory::kRouting,
     "all_backends_unhealthy"},
    {ErrorCode::kAllBackendsUnavailable, ErrorCategory::kRouting,
     "all_backends_unavailable"},
    {ErrorCode::kProviderError, ErrorCategory::kProvider, "provider_error"},
    {ErrorCode::kProviderTimeout, ErrorCategory::kProvider,
     "provider_timeout"},
    {ErrorCode::kProviderAuthFailed, ErrorCategory::kProvider,
     "provider_auth_failed"},
    {ErrorCode::kProviderRateLimited, ErrorCategory::kProvider,
     "provider_rate_limited"},
    {ErrorCode::kProviderMalformedResponse, ErrorCategory::kProvider,
     "provider_malformed_response"},
    {ErrorCode::kProviderUnsupportedModel, ErrorCategory::kProvider,
     "provider_unsupported_model"},
    {ErrorCode::kProviderNotConfigured, ErrorCategory::kProvider,
     "provider_not_configured"},
    {ErrorCode::kProviderStreamError, ErrorCategory::kProvider,
     "provider_stream_error"},
    {ErrorCode::kCacheUnavailable, ErrorCategory::kCache,
     "cache_unavailable"},
    {ErrorCode::kEmbeddingFailed, ErrorCategory::kCache, "embedding_failed"},
    {ErrorCode::kRequestRateExceeded, ErrorCategory::kRateLimit,
     "request_rate_exceeded"},
    {ErrorCode::kUnitRateExceeded, ErrorCategory::kRateLimit,
     "unit_rate_exceeded"},
    {ErrorCode::kCircuitOpen, ErrorCategory::kCircuitBreaker, "circuit_open"},
    {ErrorCode::kHalfOpenTrialsExhausted, ErrorCategory::kCircuitBreaker,
     "half_open_trials_exhausted"},
    {ErrorCode::kQueueFull, ErrorCategory::kAdmission, "queue_full"},
    {ErrorCode::kDeadlineExceeded, ErrorCategory::kAdmission,
     "deadline_exceeded"},
    {ErrorCode::kCancelled, ErrorCategory::kAdmission, "cancelled"},
}};

static_assert(static_cast<std::size_t>(ErrorCode::kCancelled) + 1 ==
                  kErrorTable.size(),
              "kErrorTable must be updated together with ErrorCode");

const ErrorCodeInfo &Lookup(ErrorCode code) {
  auto index = static_cast<std::size_t>(code);
  if (index >= kErrorTable.size()) {
    return kErrorTable[0];
  }
  return kErrorTable[index];
}

} // namespace

ErrorCategory CategoryOf(ErrorCode code) { return Lookup(code).category; }

const char *ErrorCodeName(ErrorCode code) { return Lookup(code).name; }

const char *ErrorCategoryName(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::kNone:
    return "none";
  case ErrorCategory::kConfiguration:
    return "configuration";
  case ErrorCategory::kRouting:
    return "routing";
  case ErrorCategory::kProvider:
    return "provider";
  case ErrorCategory::kCache:
    return "cache";
  case ErrorCategory::kRateLimit:
    return "rate_limit";
  case ErrorCategory::kCircuitBreaker:
    return "circuit_breaker";
  case ErrorCategory::kAdmission:
    return "admission";
  }
  return "unknown";
}

std::string GatewayError::ToString() const {
  std::string out = std::string(ErrorCategoryName(category())) + "/" +
                    ErrorCodeName(code);
  if (!message.empty()) {
    out += ": " + message;
  }
  if (!detail.empty()) {
    out += " (" + detail + ")";
  }
  return out;
}

} // namespace switchyard
