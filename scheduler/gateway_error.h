#pragma once

#include <string>
#include <utility>

namespace switchyard {

// Error categories mirror the failure taxonomy of the dispatch core. The
// category decides propagation: Configuration, Routing, RateLimit and
// Admission errors are terminal; Provider and CircuitBreaker errors are
// converted into "try the next candidate"; Cache errors never leave the cache.
enum class ErrorCategory {
  kNone,
  kConfiguration,
  kRouting,
  kProvider,
  kCache,
  kRateLimit,
  kCircuitBreaker,
  kAdmission,
};

enum class ErrorCode {
  kOk,

  // Configuration
  kInvalidBackendConfig,
  kDuplicateBackend,
  kBackendNotFound,
  kInvalidConfig,

  // Routing
  kNoCapableBackend,
  kContextLengthExceeded,
  kResidencyViolation,
  kAllBackendsUnhealthy,
  kAllBackendsUnavailable,

  // Provider
  kProviderError,
  kProviderTimeout,
  kProviderAuthFailed,
  kProviderRateLimited,
  kProviderMalformedResponse,
  kProviderUnsupportedModel,
  kProviderNotConfigured,
  kProviderStreamError,

  // Cache
  kCacheUnavailable,
  kEmbeddingFailed,

  // RateLimit
  kRequestRateExceeded,
  kUnitRateExceeded,

  // CircuitBreaker
  kCircuitOpen,
  kHalfOpenTrialsExhausted,

  // Admission
  kQueueFull,
  kDeadlineExceeded,
  kCancelled,
};

ErrorCategory CategoryOf(ErrorCode code);
const char *ErrorCodeName(ErrorCode code);
const char *ErrorCategoryName(ErrorCategory category);

// GatewayError is the single error value crossing module boundaries. A
// default-constructed instance means success.
struct GatewayError {
  ErrorCode code{ErrorCode::kOk};
  std::string message;
  // Diagnostic detail: failing stage, constraint values, backend ids.
  std::string detail;

  GatewayError() = default;
  GatewayError(ErrorCode c, std::string msg, std::string det = {})
      : code(c), message(std::move(msg)), detail(std::move(det)) {}

  bool ok() const { return code == ErrorCode::kOk; }
  ErrorCategory category() const { return CategoryOf(code); }

  // True for provider and circuit errors: the orchestrator moves on to the
  // next candidate instead of surfacing them.
  bool retryable() const {
    auto c = category();
    return c == ErrorCategory::kProvider || c == ErrorCategory::kCircuitBreaker;
  }

  // "<category>/<code>: message (detail)"
  std::string ToString() const;
};

} // namespace switchyard
