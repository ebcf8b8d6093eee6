#pragma once

#include "scheduler/gateway_error.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace switchyard {

// One turn of the logical prompt. Roles follow the chat convention:
// "user", "assistant", "tool" ("system" text lives in LogicalPrompt).
struct Message {
  std::string role;
  std::string content;
};

// Provider-independent generation parameters.
struct GenerationParams {
  double temperature{0.7};
  double top_p{1.0};
  int max_output_tokens{1024};
  std::vector<std::string> stop;
};

struct LogicalPrompt {
  std::vector<Message> messages;
  std::string system_prompt;
  GenerationParams params;
};

// What the backend must be able to do.
struct Requirements {
  std::vector<std::string> capabilities; // e.g. "vision", "tool_use"
  int min_context_tokens{0};
  std::string preferred_quality; // quality dimension; empty = "reasoning"
};

// How the caller wants the request to be served.
struct Constraints {
  int max_latency_ms{30000};
  double max_cost{0.0}; // 0 = unbounded
  std::vector<std::string> preferred_backends;
  std::vector<std::string> excluded_backends;
  std::vector<std::string> preferred_providers;
  std::vector<std::string> allowed_regions; // empty = anywhere
  bool streaming_required{false};
};

// InferenceRequest is created by the caller and never mutated by the gateway.
struct InferenceRequest {
  std::string request_id;
  std::string caller_id;
  LogicalPrompt prompt;
  Requirements requirements;
  Constraints constraints;
  bool enable_cache{true};

  // Caller-provided input token count. When <= 0 the gateway falls back to a
  // character-count estimate.
  int estimated_input_tokens{0};

  // Absolute deadline propagated through every pipeline stage.
  std::optional<std::chrono::steady_clock::time_point> deadline;
  // Shared cancellation flag toggled by the caller (e.g. client disconnect).
  std::shared_ptr<std::atomic<bool>> cancellation_flag;
  // W3C trace-id; empty when the caller did not supply one.
  std::string trace_id;

  int EstimateInputTokens() const;
  int MaxOutputTokens() const { return prompt.params.max_output_tokens; }

  bool Expired(std::chrono::steady_clock::time_point now =
                   std::chrono::steady_clock::now()) const {
    return deadline.has_value() && now >= *deadline;
  }
  bool Cancelled() const {
    return cancellation_flag && cancellation_flag->load();
  }

  // Concatenated system prompt and "role: content" lines; used for embedding.
  std::string FlattenText() const;
};

struct TokenUsage {
  int input_tokens{0};
  int output_tokens{0};
  int cached_tokens{0};

  int total() const { return input_tokens + output_tokens; }
};

enum class ResponseStatus { kSuccess, kPartial, kFiltered, kError };

const char *ResponseStatusName(ResponseStatus status);
std::optional<ResponseStatus> ParseResponseStatus(const std::string &name);

struct InferenceResponse {
  std::string request_id;
  std::string backend_id;
  std::string provider;
  std::string content;
  TokenUsage token_usage;
  int64_t latency_ms{0};
  bool cached{false};
  ResponseStatus status{ResponseStatus::kSuccess};
  std::string finish_reason;
  std::map<std::string, std::string> metadata;

  bool IsSuccess() const { return status == ResponseStatus::kSuccess; }
};

// Incremental piece of a streamed response. The last chunk has is_final set
// and carries the token usage when the provider reports it.
struct StreamChunk {
  std::string content;
  bool is_final{false};
  std::optional<TokenUsage> token_usage;
  std::string finish_reason;
};

enum class RoutingStrategy {
  kCapabilityFirst,
  kCostOptimized,
  kLatencyOptimized,
  kQualityOptimized,
  kProviderPinned,
};

const char *RoutingStrategyName(RoutingStrategy strategy);
std::optional<RoutingStrategy> ParseRoutingStrategy(const std::string &name);

// Produced by BackendRouter and consumed immediately by the Orchestrator.
struct RoutingDecision {
  std::string primary_backend_id;
  std::string primary_provider;
  std::vector<std::string> fallback_backend_ids;
  RoutingStrategy strategy{RoutingStrategy::kCapabilityFirst};
  double estimated_cost{0.0};
  int estimated_latency_ms{0};
  int estimated_input_tokens{0};
  std::size_t candidate_count{0};
  std::string reason;
};

// One backend attempt made while serving a request (diagnostic metadata).
struct AttemptRecord {
  std::string backend_id;
  std::string provider;
  GatewayError error; // ok() for the attempt that produced the response
  double duration_ms{0.0};
};

// Outcome of one gateway call: either a response or one terminal error.
struct GatewayResult {
  GatewayError error;
  std::optional<InferenceResponse> response;
  std::optional<RoutingDecision> decision;
  std::vector<AttemptRecord> attempts;

  bool ok() const { return error.ok() && response.has_value(); }
};

} // namespace switchyard
