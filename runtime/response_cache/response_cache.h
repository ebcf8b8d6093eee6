#pragma once

#include "runtime/response_cache/cache_store.h"
#include "runtime/response_cache/embedder.h"
#include "scheduler/gateway_error.h"
#include "scheduler/request_types.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace switchyard {

struct ResponseCacheConfig {
  bool enabled{true};
  std::chrono::seconds ttl{3600};
  bool similarity_enabled{false};
  double similarity_threshold{0.95};
  std::size_t max_similarity_scan{1024};
};

struct CacheStats {
  uint64_t hits{0}; // exact + similarity
  uint64_t similarity_hits{0};
  uint64_t misses{0};
  uint64_t writes{0};
  uint64_t errors{0};
  // kCacheUnavailable or kEmbeddingFailed for the most recent error.
  ErrorCode last_error{ErrorCode::kOk};

  double hit_rate() const {
    auto total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / total;
  }
};

// Bulk-removal filter. Unset fields match everything; an empty filter clears
// the whole cache.
struct CacheInvalidation {
  std::optional<std::string> backend_id;
  std::optional<std::chrono::seconds> older_than;
};

// Response cache keyed by a SHA-256 fingerprint of the request. Optionally
// falls back to an embedding similarity scan within the request's scope.
// Infrastructure failures never reach the caller: they are logged, counted
// and treated as a miss (Get) or a no-op (Set, Invalidate).
class ResponseCache {
public:
  using ClockFn = std::function<CacheRecord::TimePoint()>;

  ResponseCache(ResponseCacheConfig config, std::shared_ptr<CacheStore> store,
                std::shared_ptr<Embedder> embedder = nullptr,
                ClockFn clock = {});

  std::optional<InferenceResponse> Get(const InferenceRequest &request);
  void Set(const InferenceRequest &request, const InferenceResponse &response);
  std::size_t Invalidate(const CacheInvalidation &filter);
  void Clear();

  CacheStats Stats() const;
  bool enabled() const { return config_.enabled && store_ != nullptr; }
  bool similarity_enabled() const;
  const ResponseCacheConfig &config() const { return config_; }

  static std::string Fingerprint(const InferenceRequest &request);
  static std::string Scope(const InferenceRequest &request);

  static std::string SerializeResponse(const InferenceResponse &response);
  // Throws nlohmann::json::exception on malformed input.
  static InferenceResponse DeserializeResponse(const std::string &data);

private:
  std::optional<InferenceResponse> FindSimilar(const InferenceRequest &request,
                                               const std::string &scope);
  InferenceResponse AsHit(const CacheRecord &record,
                          const InferenceRequest &request) const;
  void RecordError(ErrorCode code, const char *op, const std::string &what);

  ResponseCacheConfig config_;
  std::shared_ptr<CacheStore> store_;
  std::shared_ptr<Embedder> embedder_;
  ClockFn clock_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> similarity_hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> writes_{0};
  std::atomic<uint64_t> errors_{0};
  std::atomic<ErrorCode> last_error_{ErrorCode::kOk};
};

} // namespace switchyard
