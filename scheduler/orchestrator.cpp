#include "scheduler/orchestrator.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace switchyard {

namespace {

double MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - start)
      .count();
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

} // namespace

const char *RateLimitScopeName(RateLimitScope scope) {
  switch (scope) {
  case RateLimitScope::kGateway:
    return "gateway";
  case RateLimitScope::kBackend:
    return "backend";
  }
  return "gateway";
}

std::optional<RateLimitScope> ParseRateLimitScope(const std::string &name) {
  auto lowered = Lower(name);
  if (lowered == "gateway") {
    return RateLimitScope::kGateway;
  }
  if (lowered == "backend") {
    return RateLimitScope::kBackend;
  }
  return std::nullopt;
}

Orchestrator::Orchestrator(Dependencies deps, OrchestratorConfig config)
    : catalog_(std::move(deps.catalog)), breaker_(std::move(deps.breaker)),
      router_(std::move(deps.router)),
      rate_limiter_(std::move(deps.rate_limiter)),
      cache_(std::move(deps.cache)), usage_(std::move(deps.usage)),
      config_(config) {
  if (!catalog_) {
    throw std::invalid_argument("Orchestrator requires a backend catalog");
  }
  if (!breaker_) {
    breaker_ = std::make_shared<CircuitBreaker>();
  }
  if (!router_) {
    router_ = std::make_shared<BackendRouter>(catalog_, breaker_);
  }
}

GatewayError
Orchestrator::RegisterAdapter(std::shared_ptr<BackendAdapter> adapter) {
  if (!adapter) {
    return GatewayError(ErrorCode::kInvalidConfig, "adapter is null");
  }
  auto provider = adapter->Name();
  if (provider.empty()) {
    return GatewayError(ErrorCode::kInvalidConfig,
                        "adapter reports an empty provider name");
  }
  std::unique_lock<std::shared_mutex> lock(adapters_mutex_);
  adapters_[provider] = std::move(adapter);
  log::Info("orchestrator", "Registered provider adapter", provider);
  return {};
}

std::shared_ptr<BackendAdapter>
Orchestrator::Adapter(const std::string &provider) const {
  std::shared_lock<std::shared_mutex> lock(adapters_mutex_);
  auto it = adapters_.find(provider);
  return it == adapters_.end() ? nullptr : it->second;
}

GatewayError Orchestrator::CheckLive(const InferenceRequest &request) const {
  if (request.Cancelled()) {
    return GatewayError(ErrorCode::kCancelled, "request was cancelled",
                        "request_id=" + request.request_id);
  }
  if (request.Expired()) {
    return GatewayError(ErrorCode::kDeadlineExceeded,
                        "request deadline exceeded",
                        "request_id=" + request.request_id);
  }
  return {};
}

GatewayError
Orchestrator::CheckGatewayRateLimit(const InferenceRequest &request) const {
  if (!rate_limiter_ || config_.rate_limit_scope != RateLimitScope::kGateway) {
    return {};
  }
  return rate_limiter_->Check(request.caller_id, "gateway",
                              request.EstimateInputTokens());
}

ProviderResult Orchestrator::Attempt(const InferenceRequest &request,
                                     const BackendDescriptor &backend,
                                     const SpanContext &parent,
                                     const AttemptFn &call,
                                     GatewayResult *result) {
  AttemptRecord record;
  record.backend_id = backend.id;
  record.provider = backend.provider;
  auto start = std::chrono::steady_clock::now();

  auto finish = [&](ProviderResult outcome) {
    record.error = outcome.error;
    record.duration_ms = MillisSince(start);
    result->attempts.push_back(record);
    return outcome;
  };

  if (rate_limiter_ && config_.rate_limit_scope == RateLimitScope::kBackend) {
    RateLimits limits;
    limits.requests_per_minute = backend.requests_per_minute;
    limits.units_per_minute = backend.units_per_minute;
    auto limited = rate_limiter_->Check(request.caller_id, backend.id,
                                        request.EstimateInputTokens(), limits);
    if (!limited.ok()) {
      ProviderResult out;
      out.error = limited;
      return finish(std::move(out));
    }
  }

  auto adapter = Adapter(backend.provider);
  if (!adapter) {
    log::Warn("orchestrator", "No adapter registered for provider",
              "provider=" + backend.provider + " backend=" + backend.id);
    return finish(ProviderResult::Failure(ErrorCode::kProviderNotConfigured,
                                          "provider is not configured",
                                          backend.provider));
  }

  Span span("backend.attempt", tracing::ChildContext(parent),
            [](const Span &s, double ms) {
              log::Debug("trace", s.name(),
                         s.AttributeString() + " trace_id=" +
                             s.context().trace_id +
                             " duration_ms=" + std::to_string(ms));
            });
  span.SetAttribute("backend", backend.id);
  span.SetAttribute("provider", backend.provider);

  auto outcome = breaker_->Call(backend.id, [&] {
    auto out = call(*adapter, backend);
    // An error-status body counts against the backend like a failed call.
    if (out.ok() && out.response->status == ResponseStatus::kError) {
      return ProviderResult::Failure(ErrorCode::kProviderError,
                                     "provider returned an error response",
                                     out.response->finish_reason);
    }
    return out;
  });
  span.SetAttribute("outcome", outcome.ok() ? "ok"
                                            : ErrorCodeName(outcome.error.code));
  span.Finish();

  GlobalMetrics().RecordBackendAttempt(backend.id, outcome.ok(),
                                       MillisSince(start));
  if (outcome.ok()) {
    auto &response = *outcome.response;
    response.request_id = request.request_id;
    if (response.backend_id.empty()) {
      response.backend_id = backend.id;
    }
    if (response.provider.empty()) {
      response.provider = backend.provider;
    }
    if (response.latency_ms <= 0) {
      response.latency_ms = static_cast<int64_t>(MillisSince(start));
    }
    response.cached = false;
  } else {
    log::Warn("orchestrator", "Backend attempt failed",
              "backend=" + backend.id + " " + outcome.error.ToString());
  }
  return finish(std::move(outcome));
}

void Orchestrator::RunCandidates(const InferenceRequest &request,
                                 const RoutingDecision &decision,
                                 const SpanContext &parent,
                                 const AttemptFn &call,
                                 const std::function<bool()> &may_continue,
                                 GatewayResult *result) {
  std::vector<std::string> candidates;
  candidates.push_back(decision.primary_backend_id);
  candidates.insert(candidates.end(), decision.fallback_backend_ids.begin(),
                    decision.fallback_backend_ids.end());

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    auto live = CheckLive(request);
    if (!live.ok()) {
      result->error = live;
      return;
    }
    auto backend = catalog_->Get(candidates[i]);
    if (!backend) {
      log::Warn("orchestrator", "Skipping backend no longer in the catalog",
                candidates[i]);
      continue;
    }
    if (!result->attempts.empty()) {
      GlobalMetrics().RecordFailover();
      log::Info("orchestrator", "Failing over",
                "request_id=" + request.request_id + " backend=" + backend->id);
    }
    auto outcome = Attempt(request, *backend, parent, call, result);
    if (outcome.ok()) {
      result->error = {};
      result->response = std::move(outcome.response);
      return;
    }
    if (!may_continue()) {
      result->error = outcome.error;
      return;
    }
  }

  std::string tried;
  for (const auto &attempt : result->attempts) {
    if (!tried.empty()) {
      tried += ",";
    }
    tried += attempt.backend_id + ":" + ErrorCodeName(attempt.error.code);
  }
  result->error = GatewayError(ErrorCode::kAllBackendsUnavailable,
                               "all candidate backends failed",
                               "attempts=" + tried);
}

GatewayResult Orchestrator::Execute(const InferenceRequest &request,
                                    std::optional<RoutingStrategy> strategy) {
  auto start = std::chrono::steady_clock::now();
  auto root = tracing::ContextForTraceId(request.trace_id);
  GatewayResult result;

  result.error = CheckLive(request);
  if (!result.error.ok()) {
    return Finish(request, std::move(result), start, "execute");
  }

  result.error = CheckGatewayRateLimit(request);
  if (!result.error.ok()) {
    return Finish(request, std::move(result), start, "execute");
  }

  const bool use_cache = request.enable_cache && cache_ && cache_->enabled();
  if (use_cache) {
    auto hit = cache_->Get(request);
    if (hit) {
      result.response = std::move(hit);
      return Finish(request, std::move(result), start, "execute");
    }
  }

  result.error = CheckLive(request);
  if (!result.error.ok()) {
    return Finish(request, std::move(result), start, "execute");
  }

  auto routed = router_->Route(request, strategy);
  if (!routed.ok()) {
    result.error = routed.error;
    return Finish(request, std::move(result), start, "execute");
  }
  result.decision = routed.decision;

  RunCandidates(
      request, *result.decision, root,
      [&](BackendAdapter &adapter, const BackendDescriptor &backend) {
        return adapter.Complete(request, backend.id);
      },
      [] { return true; }, &result);

  if (result.ok() && use_cache && result.response->IsSuccess()) {
    cache_->Set(request, *result.response);
  }
  return Finish(request, std::move(result), start, "execute");
}

GatewayResult Orchestrator::Stream(const InferenceRequest &request,
                                   std::optional<RoutingStrategy> strategy,
                                   const StreamChunkCallback &on_chunk) {
  auto start = std::chrono::steady_clock::now();
  auto root = tracing::ContextForTraceId(request.trace_id);
  GatewayResult result;

  result.error = CheckLive(request);
  if (result.error.ok()) {
    result.error = CheckGatewayRateLimit(request);
  }
  if (!result.error.ok()) {
    return Finish(request, std::move(result), start, "stream");
  }

  auto routed = router_->Route(request, strategy);
  if (!routed.ok()) {
    result.error = routed.error;
    return Finish(request, std::move(result), start, "stream");
  }
  result.decision = routed.decision;

  bool delivered = false;
  bool stopped = false;
  StreamChunkCallback forward = [&](const StreamChunk &chunk) {
    if (stopped) {
      return false;
    }
    delivered = true;
    if (request.Cancelled() || (on_chunk && !on_chunk(chunk))) {
      stopped = true;
      return false;
    }
    return true;
  };

  RunCandidates(
      request, *result.decision, root,
      [&](BackendAdapter &adapter, const BackendDescriptor &backend) {
        auto out = adapter.Stream(request, backend.id, forward);
        if (stopped) {
          // Not the backend's fault; the circuit breaker skips kCancelled.
          return ProviderResult::Failure(ErrorCode::kCancelled,
                                         "stream stopped by the caller",
                                         "backend=" + backend.id);
        }
        return out;
      },
      [&] { return !delivered; }, &result);

  if (stopped) {
    result.response.reset();
    result.error = GatewayError(ErrorCode::kCancelled,
                                "stream stopped by the caller",
                                "request_id=" + request.request_id);
  } else if (!result.ok() && delivered) {
    result.error = GatewayError(ErrorCode::kProviderStreamError,
                                "stream failed after output was delivered",
                                result.error.ToString());
  }
  return Finish(request, std::move(result), start, "stream");
}

GatewayResult Orchestrator::Finish(const InferenceRequest &request,
                                   GatewayResult result,
                                   std::chrono::steady_clock::time_point start,
                                   const char *operation) {
  double total_ms = MillisSince(start);
  GlobalMetrics().RecordLatency(total_ms);

  if (result.ok()) {
    const auto &response = *result.response;
    GlobalMetrics().RecordRequest(response.cached ? "cached" : "success");
    if (!response.cached) {
      GlobalMetrics().RecordTokens(response.backend_id,
                                   response.token_usage.input_tokens,
                                   response.token_usage.output_tokens);
    }
    log::Info("orchestrator", std::string(operation) + " completed",
              "request_id=" + request.request_id +
                  " backend=" + response.backend_id +
                  " cached=" + (response.cached ? "true" : "false") +
                  " attempts=" + std::to_string(result.attempts.size()) +
                  " total_ms=" + std::to_string(static_cast<int64_t>(total_ms)));
  } else {
    GlobalMetrics().RecordRequest(ErrorCodeName(result.error.code));
    log::Warn("orchestrator", std::string(operation) + " failed",
              "request_id=" + request.request_id + " " +
                  result.error.ToString());
  }
  EmitUsage(request, result);
  return result;
}

void Orchestrator::EmitUsage(const InferenceRequest &request,
                             const GatewayResult &result) {
  if (!usage_) {
    return;
  }
  UsageRecord record;
  record.request_id = request.request_id;
  record.caller_id = request.caller_id;
  record.attempts = static_cast<int>(result.attempts.size());
  if (result.ok()) {
    const auto &response = *result.response;
    record.backend_id = response.backend_id;
    record.provider = response.provider;
    record.input_tokens = response.token_usage.input_tokens;
    record.output_tokens = response.token_usage.output_tokens;
    record.cached_tokens = response.token_usage.cached_tokens;
    record.latency_ms = response.latency_ms;
    record.cached = response.cached;
    record.status = ResponseStatusName(response.status);
    if (!response.cached) {
      if (auto backend = catalog_->Get(response.backend_id)) {
        record.cost_estimate =
            backend->CalculateCost(record.input_tokens, record.output_tokens);
      }
    }
  } else {
    if (!result.attempts.empty()) {
      record.backend_id = result.attempts.back().backend_id;
      record.provider = result.attempts.back().provider;
    }
    record.status = ErrorCodeName(result.error.code);
  }
  try {
    usage_->Record(record);
  } catch (const std::exception &ex) {
    log::Error("orchestrator", "Usage sink failed", ex.what());
  }
}

GatewayHealth Orchestrator::CheckHealth() {
  std::vector<std::shared_ptr<BackendAdapter>> adapters;
  {
    std::shared_lock<std::shared_mutex> lock(adapters_mutex_);
    for (const auto &[provider, adapter] : adapters_) {
      adapters.push_back(adapter);
    }
  }

  GatewayHealth health;
  for (const auto &adapter : adapters) {
    ProviderHealthReport report;
    report.provider = adapter->Name();
    try {
      report.health = adapter->HealthCheck();
    } catch (const std::exception &ex) {
      report.health.status = AdapterHealthStatus::kUnhealthy;
      report.health.detail = ex.what();
    }
    if (report.health.status != AdapterHealthStatus::kUnhealthy) {
      health.healthy = true;
    }
    health.providers.push_back(std::move(report));
  }
  health.circuits = breaker_->Snapshots();
  health.circuit_stats = breaker_->Stats();
  if (cache_) {
    health.cache = cache_->Stats();
  }
  health.backends = catalog_->Size();
  return health;
}

} // namespace switchyard
