#include "scheduler/backend_catalog.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <mutex>

namespace switchyard {

namespace {

std::vector<BackendDescriptor>
SortedById(std::vector<BackendDescriptor> descriptors) {
  std::sort(descriptors.begin(), descriptors.end(),
            [](const BackendDescriptor &a, const BackendDescriptor &b) {
              return a.id < b.id;
            });
  return descriptors;
}

} // namespace

const char *BackendStatusName(BackendStatus status) {
  switch (status) {
  case BackendStatus::kActive:
    return "active";
  case BackendStatus::kDeprecated:
    return "deprecated";
  case BackendStatus::kDisabled:
    return "disabled";
  }
  return "disabled";
}

std::optional<BackendStatus> ParseBackendStatus(const std::string &name) {
  auto normalized = NormalizeCapability(name);
  if (normalized == "active") {
    return BackendStatus::kActive;
  }
  if (normalized == "deprecated") {
    return BackendStatus::kDeprecated;
  }
  if (normalized == "disabled") {
    return BackendStatus::kDisabled;
  }
  return std::nullopt;
}

GatewayError ValidateBackendDescriptor(const BackendDescriptor &descriptor) {
  if (descriptor.id.empty()) {
    return {ErrorCode::kInvalidBackendConfig, "Backend id is required"};
  }
  if (descriptor.provider.empty()) {
    return {ErrorCode::kInvalidBackendConfig, "Backend provider is required",
            "backend=" + descriptor.id};
  }
  if (descriptor.context_window <= 0) {
    return {ErrorCode::kInvalidBackendConfig,
            "context_window must be positive",
            "backend=" + descriptor.id +
                " context_window=" + std::to_string(descriptor.context_window)};
  }
  if (descriptor.max_output_tokens <= 0) {
    return {ErrorCode::kInvalidBackendConfig,
            "max_output_tokens must be positive",
            "backend=" + descriptor.id + " max_output_tokens=" +
                std::to_string(descriptor.max_output_tokens)};
  }
  if (descriptor.input_cost_per_million < 0 ||
      descriptor.output_cost_per_million < 0 ||
      descriptor.cached_cost_per_million < 0) {
    return {ErrorCode::kInvalidBackendConfig, "costs must not be negative",
            "backend=" + descriptor.id};
  }
  if (descriptor.latency_p50_ms < 0 || descriptor.latency_p99_ms < 0) {
    return {ErrorCode::kInvalidBackendConfig,
            "latency percentiles must not be negative",
            "backend=" + descriptor.id};
  }
  return {};
}

GatewayError BackendCatalog::Register(BackendDescriptor descriptor) {
  auto error = ValidateBackendDescriptor(descriptor);
  if (!error.ok()) {
    return error;
  }

  std::set<std::string> normalized;
  for (const auto &feature : descriptor.capabilities.features) {
    auto name = NormalizeCapability(feature);
    if (!name.empty()) {
      normalized.insert(std::move(name));
    }
  }
  descriptor.capabilities.features = std::move(normalized);
  if (descriptor.display_name.empty()) {
    descriptor.display_name = descriptor.id;
  }

  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (backends_.count(descriptor.id)) {
      return {ErrorCode::kDuplicateBackend, "Backend already registered",
              "backend=" + descriptor.id};
    }
    IndexLocked(descriptor);
    backends_.emplace(descriptor.id, descriptor);
  }
  log::Info("backend_catalog", "registered backend " + descriptor.id,
            "provider=" + descriptor.provider);
  return {};
}

GatewayError BackendCatalog::Unregister(const std::string &id) {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = backends_.find(id);
    if (it == backends_.end()) {
      return {ErrorCode::kBackendNotFound, "Backend not found",
              "backend=" + id};
    }
    UnindexLocked(it->second);
    backends_.erase(it);
  }
  log::Info("backend_catalog", "unregistered backend " + id);
  return {};
}

std::optional<BackendDescriptor>
BackendCatalog::Get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = backends_.find(id);
  if (it == backends_.end()) {
    return std::nullopt;
  }
  return it->second;
}

GatewayError BackendCatalog::GetOrFail(const std::string &id,
                                       BackendDescriptor &out) const {
  auto descriptor = Get(id);
  if (!descriptor) {
    return {ErrorCode::kBackendNotFound, "Backend not found",
            "backend=" + id};
  }
  out = std::move(*descriptor);
  return {};
}

bool BackendCatalog::Contains(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return backends_.count(id) > 0;
}

std::vector<BackendDescriptor> BackendCatalog::ListByCapabilities(
    const std::vector<std::string> &required) const {
  auto wanted = NormalizeCapabilities(required);

  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<BackendDescriptor> out;
  if (wanted.empty()) {
    for (const auto &[id, descriptor] : backends_) {
      if (descriptor.IsActive()) {
        out.push_back(descriptor);
      }
    }
    return SortedById(std::move(out));
  }

  // Intersect starting from the smallest index set.
  std::vector<const std::set<std::string> *> sets;
  for (const auto &capability : wanted) {
    auto it = by_capability_.find(capability);
    if (it == by_capability_.end()) {
      return {};
    }
    sets.push_back(&it->second);
  }
  std::sort(sets.begin(), sets.end(),
            [](const std::set<std::string> *a, const std::set<std::string> *b) {
              return a->size() < b->size();
            });

  for (const auto &id : *sets.front()) {
    bool in_all = std::all_of(
        sets.begin() + 1, sets.end(),
        [&id](const std::set<std::string> *s) { return s->count(id) > 0; });
    if (!in_all) {
      continue;
    }
    const auto &descriptor = backends_.at(id);
    if (descriptor.IsActive()) {
      out.push_back(descriptor);
    }
  }
  // Ids come out of std::set in order already.
  return out;
}

std::vector<BackendDescriptor>
BackendCatalog::ListByProvider(const std::string &provider) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<BackendDescriptor> out;
  auto it = by_provider_.find(provider);
  if (it == by_provider_.end()) {
    return out;
  }
  for (const auto &id : it->second) {
    out.push_back(backends_.at(id));
  }
  return out;
}

std::vector<BackendDescriptor>
BackendCatalog::List(std::optional<BackendStatus> status) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<BackendDescriptor> out;
  for (const auto &[id, descriptor] : backends_) {
    if (!status || descriptor.status == *status) {
      out.push_back(descriptor);
    }
  }
  return SortedById(std::move(out));
}

GatewayError BackendCatalog::UpdateStatus(const std::string &id,
                                          BackendStatus status) {
  BackendStatus previous;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = backends_.find(id);
    if (it == backends_.end()) {
      return {ErrorCode::kBackendNotFound, "Backend not found",
              "backend=" + id};
    }
    previous = it->second.status;
    it->second.status = status;
  }
  if (previous != status) {
    log::Info("backend_catalog", "backend " + id + " status changed",
              std::string(BackendStatusName(previous)) + " -> " +
                  BackendStatusName(status));
  }
  return {};
}

std::vector<std::string> BackendCatalog::Providers() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &[provider, ids] : by_provider_) {
    out.push_back(provider);
  }
  return out;
}

std::vector<std::string> BackendCatalog::Capabilities() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &[capability, ids] : by_capability_) {
    out.push_back(capability);
  }
  return out;
}

std::size_t BackendCatalog::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return backends_.size();
}

CatalogStats BackendCatalog::Stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  CatalogStats stats;
  stats.total = backends_.size();
  for (const auto &[id, descriptor] : backends_) {
    switch (descriptor.status) {
    case BackendStatus::kActive:
      ++stats.active;
      break;
    case BackendStatus::kDeprecated:
      ++stats.deprecated;
      break;
    case BackendStatus::kDisabled:
      ++stats.disabled;
      break;
    }
  }
  for (const auto &[provider, ids] : by_provider_) {
    stats.by_provider[provider] = ids.size();
  }
  for (const auto &[capability, ids] : by_capability_) {
    stats.by_capability[capability] = ids.size();
  }
  return stats;
}

void BackendCatalog::IndexLocked(const BackendDescriptor &descriptor) {
  for (const auto &capability : descriptor.capabilities.features) {
    by_capability_[capability].insert(descriptor.id);
  }
  by_provider_[descriptor.provider].insert(descriptor.id);
}

void BackendCatalog::UnindexLocked(const BackendDescriptor &descriptor) {
  for (const auto &capability : descriptor.capabilities.features) {
    auto it = by_capability_.find(capability);
    if (it == by_capability_.end()) {
      continue;
    }
    it->second.erase(descriptor.id);
    if (it->second.empty()) {
      by_capability_.erase(it);
    }
  }
  auto it = by_provider_.find(descriptor.provider);
  if (it != by_provider_.end()) {
    it->second.erase(descriptor.id);
    if (it->second.empty()) {
      by_provider_.erase(it);
    }
  }
}

} // namespace switchyard
