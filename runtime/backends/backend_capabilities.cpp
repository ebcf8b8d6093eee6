#include "runtime/backends/backend_capabilities.h"

#include <algorithm>
#include <cctype>

namespace switchyard {

namespace {

CapabilityCheckResult Missing(const std::string &feature,
                              const std::string &reason) {
  CapabilityCheckResult out;
  out.supported = false;
  out.missing_feature = feature;
  out.reason = reason;
  return out;
}

} // namespace

std::string NormalizeCapability(const std::string &name) {
  auto begin = name.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = name.find_last_not_of(" \t\r\n");
  std::string out = name.substr(begin, end - begin + 1);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::vector<std::string>
NormalizeCapabilities(const std::vector<std::string> &names) {
  std::set<std::string> unique;
  for (const auto &name : names) {
    auto normalized = NormalizeCapability(name);
    if (!normalized.empty()) {
      unique.insert(std::move(normalized));
    }
  }
  return {unique.begin(), unique.end()};
}

CapabilityCheckResult
CheckBackendCapabilities(const BackendCapabilities &capabilities,
                         const BackendFeatureRequirements &requirements) {
  if (requirements.needs_streaming && !capabilities.Has("streaming")) {
    return Missing("streaming", "Backend does not support streaming");
  }
  for (const auto &feature : requirements.features) {
    auto normalized = NormalizeCapability(feature);
    if (normalized.empty()) {
      continue;
    }
    if (!capabilities.Has(normalized)) {
      return Missing(normalized,
                     "Backend does not support capability '" + normalized +
                         "'");
    }
  }
  return {};
}

} // namespace switchyard
