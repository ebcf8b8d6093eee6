#pragma once

#include "scheduler/gateway_error.h"
#include "scheduler/request_types.h"

#include <functional>
#include <optional>
#include <string>

namespace switchyard {

// Outcome of one provider call. Exactly one of response / error is set:
// error.ok() implies response has a value.
struct ProviderResult {
  std::optional<InferenceResponse> response;
  GatewayError error;

  bool ok() const { return error.ok() && response.has_value(); }

  static ProviderResult Success(InferenceResponse response) {
    ProviderResult out;
    out.response = std::move(response);
    return out;
  }
  static ProviderResult Failure(ErrorCode code, std::string message,
                                std::string detail = {}) {
    ProviderResult out;
    out.error = GatewayError(code, std::move(message), std::move(detail));
    return out;
  }
};

enum class AdapterHealthStatus { kHealthy, kDegraded, kUnhealthy };

inline const char *AdapterHealthStatusName(AdapterHealthStatus status) {
  switch (status) {
  case AdapterHealthStatus::kHealthy:
    return "healthy";
  case AdapterHealthStatus::kDegraded:
    return "degraded";
  case AdapterHealthStatus::kUnhealthy:
    return "unhealthy";
  }
  return "unhealthy";
}

struct AdapterHealth {
  AdapterHealthStatus status{AdapterHealthStatus::kHealthy};
  std::string circuit_hint; // provider-side view, e.g. "closed"
  std::string detail;
};

// Invoked once per streamed chunk. Returning false stops the stream (the
// caller went away); the adapter must then return promptly.
using StreamChunkCallback = std::function<bool(const StreamChunk &)>;

// BackendAdapter is the plugin interface towards one provider (Anthropic,
// OpenAI, Bedrock, a local runtime...). One adapter serves every backend
// whose descriptor names its provider.
//
// Adapters translate the logical prompt into the provider wire format and
// map provider failures onto ErrorCode::kProvider*. They must not throw for
// ordinary provider failures; an escaping exception is still recorded as a
// provider failure by the circuit breaker.
//
// Thread safety: all methods must be safe to call concurrently.
class BackendAdapter {
public:
  virtual ~BackendAdapter() = default;

  virtual ProviderResult Complete(const InferenceRequest &request,
                                  const std::string &backend_id) = 0;

  // Streams chunks through on_chunk. The returned result carries the
  // assembled response (content may be empty) or the error that ended the
  // stream.
  virtual ProviderResult Stream(const InferenceRequest &request,
                                const std::string &backend_id,
                                const StreamChunkCallback &on_chunk) = 0;

  virtual AdapterHealth HealthCheck() = 0;

  virtual bool SupportsCapability(const std::string &capability) const = 0;
  virtual bool SupportsModel(const std::string &backend_id) const = 0;

  // Provider name; matches BackendDescriptor::provider.
  virtual std::string Name() const = 0;
};

} // namespace switchyard
