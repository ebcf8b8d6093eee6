#include "scheduler/backend_router.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace switchyard {

namespace {

template <typename Pred>
std::vector<BackendDescriptor> Keep(std::vector<BackendDescriptor> in,
                                    Pred pred) {
  in.erase(std::remove_if(in.begin(), in.end(),
                          [&](const BackendDescriptor &d) { return !pred(d); }),
           in.end());
  return in;
}

bool Contains(const std::vector<std::string> &list, const std::string &value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

std::string Join(const std::vector<std::string> &values) {
  std::string out;
  for (const auto &v : values) {
    if (!out.empty()) {
      out += ",";
    }
    out += v;
  }
  return out;
}

RoutingResult Fail(ErrorCode code, const std::string &stage,
                   const std::string &message, const std::string &detail) {
  GlobalMetrics().RecordRoutingFailure(stage);
  log::Warn("router", message, detail);
  RoutingResult result;
  result.error = GatewayError(code, message, detail);
  return result;
}

} // namespace

BackendRouter::BackendRouter(std::shared_ptr<BackendCatalog> catalog,
                             std::shared_ptr<CircuitBreaker> breaker,
                             RouterConfig config)
    : catalog_(std::move(catalog)), breaker_(std::move(breaker)),
      config_(config) {}

double BackendRouter::RankingCost(const BackendDescriptor &backend,
                                  int input_units, int output_units) {
  if (backend.provisioned_throughput) {
    return 0.0;
  }
  return backend.CalculateCost(input_units, output_units);
}

std::vector<BackendDescriptor>
BackendRouter::FilterByCapability(const InferenceRequest &request) const {
  auto required = request.requirements.capabilities;
  if (request.constraints.streaming_required) {
    required.push_back("streaming");
  }
  auto candidates = catalog_->ListByCapabilities(required);
  const auto &excluded = request.constraints.excluded_backends;
  if (!excluded.empty()) {
    candidates = Keep(std::move(candidates), [&](const BackendDescriptor &d) {
      return !Contains(excluded, d.id);
    });
  }
  return candidates;
}

std::vector<BackendDescriptor>
BackendRouter::FilterByHealth(std::vector<BackendDescriptor> candidates) const {
  if (!breaker_) {
    return candidates;
  }
  return Keep(std::move(candidates), [&](const BackendDescriptor &d) {
    if (breaker_->State(d.id) == CircuitState::kOpen) {
      log::Debug("router", "Skipping backend with open circuit", d.id);
      return false;
    }
    return true;
  });
}

std::vector<BackendDescriptor>
BackendRouter::Rank(const InferenceRequest &request,
                    std::vector<BackendDescriptor> candidates,
                    RoutingStrategy strategy) const {
  const int input = request.EstimateInputTokens();
  const int output = request.MaxOutputTokens();

  auto by_cost = [&](const BackendDescriptor &a, const BackendDescriptor &b) {
    double ca = RankingCost(a, input, output);
    double cb = RankingCost(b, input, output);
    if (ca != cb) {
      return ca < cb;
    }
    return a.id < b.id;
  };

  if (request.constraints.max_cost > 0.0) {
    auto affordable = Keep(candidates, [&](const BackendDescriptor &d) {
      return RankingCost(d, input, output) <= request.constraints.max_cost;
    });
    if (!affordable.empty()) {
      candidates = std::move(affordable);
    }
  }

  switch (strategy) {
  case RoutingStrategy::kLatencyOptimized:
    std::sort(candidates.begin(), candidates.end(),
              [](const BackendDescriptor &a, const BackendDescriptor &b) {
                if (a.latency_p50_ms != b.latency_p50_ms) {
                  return a.latency_p50_ms < b.latency_p50_ms;
                }
                return a.id < b.id;
              });
    break;
  case RoutingStrategy::kQualityOptimized: {
    std::string dimension = request.requirements.preferred_quality.empty()
                                ? "reasoning"
                                : request.requirements.preferred_quality;
    std::sort(candidates.begin(), candidates.end(),
              [&](const BackendDescriptor &a, const BackendDescriptor &b) {
                double qa = a.QualityScore(dimension);
                double qb = b.QualityScore(dimension);
                if (qa != qb) {
                  return qa > qb;
                }
                return a.id < b.id;
              });
    break;
  }
  case RoutingStrategy::kProviderPinned: {
    const auto &providers = request.constraints.preferred_providers;
    if (!providers.empty()) {
      auto pinned = Keep(candidates, [&](const BackendDescriptor &d) {
        return Contains(providers, d.provider);
      });
      if (!pinned.empty()) {
        candidates = std::move(pinned);
      } else {
        log::Debug("router", "No candidate from preferred providers",
                   Join(providers));
      }
    }
    std::sort(candidates.begin(), candidates.end(), by_cost);
    break;
  }
  case RoutingStrategy::kCostOptimized:
  case RoutingStrategy::kCapabilityFirst:
    std::sort(candidates.begin(), candidates.end(), by_cost);
    break;
  }

  const auto &preferred = request.constraints.preferred_backends;
  if (!preferred.empty()) {
    std::stable_partition(candidates.begin(), candidates.end(),
                          [&](const BackendDescriptor &d) {
                            return Contains(preferred, d.id);
                          });
  }
  return candidates;
}

RoutingResult BackendRouter::Route(const InferenceRequest &request,
                                   std::optional<RoutingStrategy> strategy) const {
  const RoutingStrategy chosen = strategy.value_or(config_.default_strategy);
  const int input = request.EstimateInputTokens();
  const int output = request.MaxOutputTokens();

  // 1. Capability
  auto candidates = FilterByCapability(request);
  if (candidates.empty()) {
    return Fail(ErrorCode::kNoCapableBackend, "capability",
                "No backend supports the required capabilities",
                "required=" + Join(request.requirements.capabilities));
  }

  // 2. Context length
  // Widened so caller-supplied token counts near INT_MAX cannot wrap.
  const int64_t required_context =
      std::max(static_cast<int64_t>(input) + static_cast<int64_t>(output),
               static_cast<int64_t>(request.requirements.min_context_tokens));
  candidates = Keep(std::move(candidates), [&](const BackendDescriptor &d) {
    return static_cast<int64_t>(d.context_window) >= required_context;
  });
  if (candidates.empty()) {
    return Fail(ErrorCode::kContextLengthExceeded, "context",
                "Request exceeds every candidate context window",
                "required_context=" + std::to_string(required_context));
  }

  // 3. Residency
  const auto &allowed = request.constraints.allowed_regions;
  if (!allowed.empty()) {
    candidates = Keep(std::move(candidates), [&](const BackendDescriptor &d) {
      if (d.regions.empty()) {
        return true;
      }
      return std::any_of(d.regions.begin(), d.regions.end(),
                         [&](const std::string &r) { return Contains(allowed, r); });
    });
    if (candidates.empty()) {
      return Fail(ErrorCode::kResidencyViolation, "residency",
                  "No backend available in the allowed regions",
                  "allowed_regions=" + Join(allowed));
    }
  }

  // 4. Health
  candidates = FilterByHealth(std::move(candidates));
  if (candidates.empty()) {
    return Fail(ErrorCode::kAllBackendsUnhealthy, "health",
                "Every candidate backend has an open circuit", "");
  }

  // 5. Latency (soft)
  const int max_latency = request.constraints.max_latency_ms;
  if (max_latency > 0) {
    auto fast = Keep(candidates, [&](const BackendDescriptor &d) {
      return d.latency_p99_ms <= max_latency;
    });
    if (!fast.empty()) {
      candidates = std::move(fast);
    }
  }
  const std::size_t candidate_count = candidates.size();

  // 6. Ranking
  auto ranked = Rank(request, std::move(candidates), chosen);
  const auto &primary = ranked.front();

  RoutingDecision decision;
  decision.primary_backend_id = primary.id;
  decision.primary_provider = primary.provider;
  for (std::size_t i = 1;
       i < ranked.size() && decision.fallback_backend_ids.size() <
                                config_.max_fallbacks;
       ++i) {
    decision.fallback_backend_ids.push_back(ranked[i].id);
  }
  decision.strategy = chosen;
  decision.estimated_cost = primary.CalculateCost(input, output);
  decision.estimated_latency_ms = primary.latency_p50_ms;
  decision.estimated_input_tokens = input;
  decision.candidate_count = candidate_count;
  decision.reason = "Selected " + primary.display_name + " (" + primary.id +
                    ") from " + primary.provider + " using " +
                    RoutingStrategyName(chosen) + " strategy";

  std::ostringstream extra;
  extra << "request_id=" << request.request_id << " backend=" << primary.id
        << " fallbacks=" << Join(decision.fallback_backend_ids)
        << " cost=" << std::fixed << std::setprecision(6)
        << decision.estimated_cost
        << " latency_ms=" << decision.estimated_latency_ms;
  log::Info("router", "Routed request", extra.str());

  RoutingResult result;
  result.decision = std::move(decision);
  return result;
}

} // namespace switchyard
