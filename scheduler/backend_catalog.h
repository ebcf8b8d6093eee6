#pragma once

#include "runtime/backends/backend_capabilities.h"
#include "scheduler/gateway_error.h"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchyard {

enum class BackendStatus { kActive, kDeprecated, kDisabled };

const char *BackendStatusName(BackendStatus status);
std::optional<BackendStatus> ParseBackendStatus(const std::string &name);

// Static description of one backend (a provider model endpoint). Immutable
// once registered; only the status moves, through BackendCatalog.
struct BackendDescriptor {
  std::string id;
  std::string provider;
  std::string display_name;
  BackendCapabilities capabilities;

  int context_window{0};
  int max_output_tokens{0};

  // USD per million units.
  double input_cost_per_million{0.0};
  double output_cost_per_million{0.0};
  double cached_cost_per_million{0.0};

  int requests_per_minute{0}; // 0 = unlimited
  int units_per_minute{0};    // 0 = unlimited

  int latency_p50_ms{0};
  int latency_p99_ms{0};

  BackendStatus status{BackendStatus::kActive};
  std::vector<std::string> regions; // empty = no residency restriction

  // Task category -> score in [0, 1].
  std::map<std::string, double> quality_scores;

  // Committed capacity: marginal cost is treated as zero when ranking.
  bool provisioned_throughput{false};

  double CalculateCost(int input_units, int output_units) const {
    return (static_cast<double>(input_units) * input_cost_per_million +
            static_cast<double>(output_units) * output_cost_per_million) /
           1e6;
  }

  double QualityScore(const std::string &dimension) const {
    auto it = quality_scores.find(dimension);
    return it == quality_scores.end() ? 0.0 : it->second;
  }

  bool IsActive() const { return status == BackendStatus::kActive; }
};

// Validates the descriptor invariants. Returns kOk or kInvalidBackendConfig.
GatewayError ValidateBackendDescriptor(const BackendDescriptor &descriptor);

struct CatalogStats {
  std::size_t total{0};
  std::size_t active{0};
  std::size_t deprecated{0};
  std::size_t disabled{0};
  std::map<std::string, std::size_t> by_provider;
  std::map<std::string, std::size_t> by_capability;
};

// BackendCatalog is the registry of every backend the gateway may route to.
// It maintains capability and provider indexes so capability queries do not
// scan the full catalog.
//
// Thread safety: all public methods are thread-safe. Reads share the lock;
// Register/Unregister/UpdateStatus take it exclusively.
class BackendCatalog {
public:
  // Validates the descriptor, lower-cases its capabilities and indexes it.
  GatewayError Register(BackendDescriptor descriptor);

  // Removes a backend and its index entries. Returns kBackendNotFound when
  // the id is unknown.
  GatewayError Unregister(const std::string &id);

  std::optional<BackendDescriptor> Get(const std::string &id) const;
  GatewayError GetOrFail(const std::string &id, BackendDescriptor &out) const;
  bool Contains(const std::string &id) const;

  // Active backends supporting every listed capability, sorted by id. An
  // empty list returns every active backend.
  std::vector<BackendDescriptor>
  ListByCapabilities(const std::vector<std::string> &required) const;

  std::vector<BackendDescriptor>
  ListByProvider(const std::string &provider) const;

  // All backends, optionally filtered by status, sorted by id.
  std::vector<BackendDescriptor>
  List(std::optional<BackendStatus> status = std::nullopt) const;

  GatewayError UpdateStatus(const std::string &id, BackendStatus status);

  std::vector<std::string> Providers() const;
  std::vector<std::string> Capabilities() const;
  std::size_t Size() const;
  CatalogStats Stats() const;

private:
  void IndexLocked(const BackendDescriptor &descriptor);
  void UnindexLocked(const BackendDescriptor &descriptor);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, BackendDescriptor> backends_;
  std::map<std::string, std::set<std::string>> by_capability_;
  std::map<std::string, std::set<std::string>> by_provider_;
};

} // namespace switchyard
