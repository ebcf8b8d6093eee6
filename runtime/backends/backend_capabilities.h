#pragma once

#include <set>
#include <string>
#include <vector>

namespace switchyard {

// BackendCapabilities captures the feature surface a backend declares in the
// catalog. Capability names are free-form lower-case strings so new features
// ("audio", "json_mode") need no code change.
struct BackendCapabilities {
  std::set<std::string> features;

  bool Has(const std::string &feature) const {
    return features.count(feature) > 0;
  }
};

// Feature requirements extracted from a request.
struct BackendFeatureRequirements {
  std::vector<std::string> features;
  bool needs_streaming{false};
};

struct CapabilityCheckResult {
  bool supported{true};
  std::string missing_feature;
  std::string reason;
};

// Lower-cases and trims a capability name. Returns an empty string for input
// that is blank after trimming.
std::string NormalizeCapability(const std::string &name);

// Normalises, de-duplicates and sorts a capability list.
std::vector<std::string>
NormalizeCapabilities(const std::vector<std::string> &names);

CapabilityCheckResult
CheckBackendCapabilities(const BackendCapabilities &capabilities,
                         const BackendFeatureRequirements &requirements);

} // namespace switchyard
