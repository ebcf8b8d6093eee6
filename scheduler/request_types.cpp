#include "scheduler/request_types.h"

#include <algorithm>
#include <cctype>

namespace switchyard {

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return value;
}

} // namespace

int InferenceRequest::EstimateInputTokens() const {
  if (estimated_input_tokens > 0) {
    return estimated_input_tokens;
  }
  std::size_t chars = prompt.system_prompt.size();
  for (const auto &message : prompt.messages) {
    chars += message.content.size();
  }
  // Roughly four characters per token for English text.
  return static_cast<int>((chars + 3) / 4);
}

std::string InferenceRequest::FlattenText() const {
  std::string text;
  if (!prompt.system_prompt.empty()) {
    text += prompt.system_prompt;
  }
  for (const auto &message : prompt.messages) {
    if (!text.empty()) {
      text += "\n";
    }
    text += message.role + ": " + message.content;
  }
  return text;
}

const char *ResponseStatusName(ResponseStatus status) {
  switch (status) {
  case ResponseStatus::kSuccess:
    return "success";
  case ResponseStatus::kPartial:
    return "partial";
  case ResponseStatus::kFiltered:
    return "filtered";
  case ResponseStatus::kError:
    return "error";
  }
  return "error";
}

std::optional<ResponseStatus> ParseResponseStatus(const std::string &name) {
  auto lowered = ToLower(name);
  if (lowered == "success") {
    return ResponseStatus::kSuccess;
  }
  if (lowered == "partial") {
    return ResponseStatus::kPartial;
  }
  if (lowered == "filtered") {
    return ResponseStatus::kFiltered;
  }
  if (lowered == "error") {
    return ResponseStatus::kError;
  }
  return std::nullopt;
}

const char *RoutingStrategyName(RoutingStrategy strategy) {
  switch (strategy) {
  case RoutingStrategy::kCapabilityFirst:
    return "capability_first";
  case RoutingStrategy::kCostOptimized:
    return "cost_optimized";
  case RoutingStrategy::kLatencyOptimized:
    return "latency_optimized";
  case RoutingStrategy::kQualityOptimized:
    return "quality_optimized";
  case RoutingStrategy::kProviderPinned:
    return "provider_pinned";
  }
  return "capability_first";
}

std::optional<RoutingStrategy> ParseRoutingStrategy(const std::string &name) {
  auto lowered = ToLower(name);
  if (lowered == "capability_first" || lowered == "capability") {
    return RoutingStrategy::kCapabilityFirst;
  }
  if (lowered == "cost_optimized" || lowered == "cost") {
    return RoutingStrategy::kCostOptimized;
  }
  if (lowered == "latency_optimized" || lowered == "latency") {
    return RoutingStrategy::kLatencyOptimized;
  }
  if (lowered == "quality_optimized" || lowered == "quality") {
    return RoutingStrategy::kQualityOptimized;
  }
  if (lowered == "provider_pinned" || lowered == "provider") {
    return RoutingStrategy::kProviderPinned;
  }
  return std::nullopt;
}

} // namespace switchyard
