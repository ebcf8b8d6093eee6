#pragma once

#include "scheduler/backend_catalog.h"
#include "scheduler/circuit_breaker.h"
#include "scheduler/request_types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace switchyard {

struct RouterConfig {
  RoutingStrategy default_strategy{RoutingStrategy::kCapabilityFirst};
  std::size_t max_fallbacks{2};
};

struct RoutingResult {
  GatewayError error;
  std::optional<RoutingDecision> decision;

  bool ok() const { return error.ok() && decision.has_value(); }
};

// BackendRouter picks a primary backend and an ordered fallback list for a
// request. Candidates pass through six stages in order:
//
//   1. capability   every requested capability (+ "streaming" if required)
//   2. context      context_window >= max(input + max_output, min_context)
//   3. residency    declares no regions or intersects the allowed ones
//   4. health       circuit not open (half-open passes)
//   5. latency      p99 <= max_latency_ms, unless nothing would remain
//   6. ranking      by strategy; ties break by id
//
// The first four stages fail the route with a stage-specific error when they
// leave no candidate. Routing is deterministic for a fixed catalog, circuit
// state and request.
class BackendRouter {
public:
  BackendRouter(std::shared_ptr<BackendCatalog> catalog,
                std::shared_ptr<CircuitBreaker> breaker = nullptr,
                RouterConfig config = {});

  RoutingResult
  Route(const InferenceRequest &request,
        std::optional<RoutingStrategy> strategy = std::nullopt) const;

  const RouterConfig &config() const { return config_; }

  // Ranking key used by the cost-ordered strategies; provisioned backends
  // count as free.
  static double RankingCost(const BackendDescriptor &backend, int input_units,
                            int output_units);

private:
  std::vector<BackendDescriptor>
  FilterByCapability(const InferenceRequest &request) const;
  std::vector<BackendDescriptor>
  FilterByHealth(std::vector<BackendDescriptor> candidates) const;
  std::vector<BackendDescriptor> Rank(const InferenceRequest &request,
                                      std::vector<BackendDescriptor> candidates,
                                      RoutingStrategy strategy) const;

  std::shared_ptr<BackendCatalog> catalog_;
  std::shared_ptr<CircuitBreaker> breaker_;
  RouterConfig config_;
};

} // namespace switchyard
