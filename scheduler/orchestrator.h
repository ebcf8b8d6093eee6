#pragma once

#include "runtime/backends/backend_adapter.h"
#include "runtime/response_cache/response_cache.h"
#include "scheduler/admission_queue.h"
#include "scheduler/backend_catalog.h"
#include "scheduler/backend_router.h"
#include "scheduler/circuit_breaker.h"
#include "server/auth/rate_limiter.h"
#include "server/logging/usage_logger.h"
#include "server/tracing/span.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace switchyard {

// Where request/unit budgets are enforced.
enum class RateLimitScope {
  kGateway, // one budget per caller, checked before routing
  kBackend, // one budget per (caller, backend), checked before each attempt
};

const char *RateLimitScopeName(RateLimitScope scope);
std::optional<RateLimitScope> ParseRateLimitScope(const std::string &name);

struct OrchestratorConfig {
  RateLimitScope rate_limit_scope{RateLimitScope::kGateway};
};

struct ProviderHealthReport {
  std::string provider;
  AdapterHealth health;
};

struct GatewayHealth {
  bool healthy{false}; // at least one provider is not unhealthy
  std::vector<ProviderHealthReport> providers;
  std::vector<CircuitSnapshot> circuits;
  CircuitStats circuit_stats;
  std::optional<CacheStats> cache;
  std::optional<QueueStats> queue; // filled by Dispatcher::CheckHealth
  std::size_t backends{0};
};

// Orchestrator runs one request through the gateway pipeline:
//
//   rate limit -> cache lookup -> route -> primary -> fallbacks...
//              -> cache write -> usage record
//
// Every backend attempt goes through the circuit breaker, so a backend whose
// circuit opened after routing is skipped without calling its adapter.
// Deadlines and cancellation are checked before every stage and attempt.
// The returned GatewayResult always carries the attempt list, including for
// failures.
//
// Thread safety: Execute, Stream and CheckHealth may run concurrently.
class Orchestrator {
public:
  struct Dependencies {
    std::shared_ptr<BackendCatalog> catalog;      // required
    std::shared_ptr<CircuitBreaker> breaker;      // default-constructed if null
    std::shared_ptr<BackendRouter> router;        // built from catalog if null
    std::shared_ptr<RateLimiter> rate_limiter;    // optional
    std::shared_ptr<ResponseCache> cache;         // optional
    std::shared_ptr<UsageSink> usage;             // optional
  };

  explicit Orchestrator(Dependencies deps, OrchestratorConfig config = {});

  // Adapters are keyed by Name(), which must match BackendDescriptor::provider.
  // A later registration for the same provider replaces the earlier one.
  GatewayError RegisterAdapter(std::shared_ptr<BackendAdapter> adapter);
  std::shared_ptr<BackendAdapter> Adapter(const std::string &provider) const;

  GatewayResult
  Execute(const InferenceRequest &request,
          std::optional<RoutingStrategy> strategy = std::nullopt);

  // Streams chunks to on_chunk. Never consults or fills the cache. Fails over
  // to the next candidate only while no chunk has been delivered.
  GatewayResult Stream(const InferenceRequest &request,
                       std::optional<RoutingStrategy> strategy,
                       const StreamChunkCallback &on_chunk);

  GatewayHealth CheckHealth();

  const std::shared_ptr<BackendCatalog> &catalog() const { return catalog_; }
  const std::shared_ptr<CircuitBreaker> &breaker() const { return breaker_; }
  const std::shared_ptr<BackendRouter> &router() const { return router_; }
  const std::shared_ptr<ResponseCache> &cache() const { return cache_; }

private:
  using AttemptFn = std::function<ProviderResult(BackendAdapter &,
                                                const BackendDescriptor &)>;

  GatewayError CheckLive(const InferenceRequest &request) const;
  GatewayError CheckGatewayRateLimit(const InferenceRequest &request) const;

  // One attempt against `backend`; appends to result->attempts.
  ProviderResult Attempt(const InferenceRequest &request,
                         const BackendDescriptor &backend,
                         const SpanContext &parent, const AttemptFn &call,
                         GatewayResult *result);

  // Walks primary then fallbacks until one attempt succeeds. `may_continue`
  // is consulted after each failure.
  void RunCandidates(const InferenceRequest &request,
                     const RoutingDecision &decision, const SpanContext &parent,
                     const AttemptFn &call,
                     const std::function<bool()> &may_continue,
                     GatewayResult *result);

  GatewayResult Finish(const InferenceRequest &request, GatewayResult result,
                       std::chrono::steady_clock::time_point start,
                       const char *operation);
  void EmitUsage(const InferenceRequest &request, const GatewayResult &result);

  std::shared_ptr<BackendCatalog> catalog_;
  std::shared_ptr<CircuitBreaker> breaker_;
  std::shared_ptr<BackendRouter> router_;
  std::shared_ptr<RateLimiter> rate_limiter_;
  std::shared_ptr<ResponseCache> cache_;
  std::shared_ptr<UsageSink> usage_;
  OrchestratorConfig config_;

  mutable std::shared_mutex adapters_mutex_;
  std::map<std::string, std::shared_ptr<BackendAdapter>> adapters_;
};

} // namespace switchyard
