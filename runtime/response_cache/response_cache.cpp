#include "runtime/response_cache/response_cache.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace switchyard {

namespace {

std::string Sha256Hex(const std::string &data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(),
         hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::vector<std::string> SortedCapabilities(const InferenceRequest &request) {
  auto caps = request.requirements.capabilities;
  std::sort(caps.begin(), caps.end());
  caps.erase(std::unique(caps.begin(), caps.end()), caps.end());
  return caps;
}

json ParamsJson(const GenerationParams &params) {
  return json{{"temperature", params.temperature},
              {"top_p", params.top_p},
              {"max_output_tokens", params.max_output_tokens},
              {"stop", params.stop}};
}

} // namespace

ResponseCache::ResponseCache(ResponseCacheConfig config,
                             std::shared_ptr<CacheStore> store,
                             std::shared_ptr<Embedder> embedder,
                             ClockFn clock)
    : config_(std::move(config)), store_(std::move(store)),
      embedder_(std::move(embedder)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
  if (config_.similarity_enabled && !embedder_) {
    log::Warn("response_cache",
              "Similarity matching requested without an embedder; disabled");
  }
}

bool ResponseCache::similarity_enabled() const {
  return config_.similarity_enabled && embedder_ != nullptr;
}

// nlohmann::json objects keep keys sorted, so dump() is canonical.
std::string ResponseCache::Fingerprint(const InferenceRequest &request) {
  json messages = json::array();
  for (const auto &message : request.prompt.messages) {
    messages.push_back({{"role", message.role}, {"content", message.content}});
  }
  json content{{"messages", messages},
               {"system_prompt", request.prompt.system_prompt},
               {"params", ParamsJson(request.prompt.params)},
               {"capabilities", SortedCapabilities(request)}};
  return Sha256Hex(content.dump());
}

std::string ResponseCache::Scope(const InferenceRequest &request) {
  json content{{"params", ParamsJson(request.prompt.params)},
               {"capabilities", SortedCapabilities(request)}};
  return Sha256Hex(content.dump());
}

std::string ResponseCache::SerializeResponse(const InferenceResponse &response) {
  json j{{"request_id", response.request_id},
         {"backend_id", response.backend_id},
         {"provider", response.provider},
         {"content", response.content},
         {"token_usage",
          {{"input_tokens", response.token_usage.input_tokens},
           {"output_tokens", response.token_usage.output_tokens},
           {"cached_tokens", response.token_usage.cached_tokens}}},
         {"latency_ms", response.latency_ms},
         {"status", ResponseStatusName(response.status)},
         {"finish_reason", response.finish_reason},
         {"metadata", response.metadata}};
  return j.dump();
}

InferenceResponse ResponseCache::DeserializeResponse(const std::string &data) {
  auto j = json::parse(data);
  InferenceResponse response;
  response.request_id = j.value("request_id", "");
  response.backend_id = j.at("backend_id").get<std::string>();
  response.provider = j.at("provider").get<std::string>();
  response.content = j.at("content").get<std::string>();
  const auto &usage = j.at("token_usage");
  response.token_usage.input_tokens = usage.at("input_tokens").get<int>();
  response.token_usage.output_tokens = usage.at("output_tokens").get<int>();
  response.token_usage.cached_tokens = usage.value("cached_tokens", 0);
  response.latency_ms = j.value("latency_ms", int64_t{0});
  auto status = ParseResponseStatus(j.value("status", "success"));
  response.status = status.value_or(ResponseStatus::kSuccess);
  response.finish_reason = j.value("finish_reason", "");
  if (j.contains("metadata")) {
    response.metadata =
        j.at("metadata").get<std::map<std::string, std::string>>();
  }
  return response;
}

InferenceResponse ResponseCache::AsHit(const CacheRecord &record,
                                       const InferenceRequest &request) const {
  auto response = DeserializeResponse(record.response_json);
  response.request_id = request.request_id;
  response.cached = true;
  response.latency_ms = 0;
  return response;
}

void ResponseCache::RecordError(ErrorCode code, const char *op,
                                const std::string &what) {
  errors_.fetch_add(1, std::memory_order_relaxed);
  last_error_.store(code, std::memory_order_relaxed);
  GlobalMetrics().RecordCacheError();
  GatewayError error(code, std::string("Cache ") + op + " failed", what);
  log::Error("response_cache", error.message, error.ToString());
}

std::optional<InferenceResponse>
ResponseCache::Get(const InferenceRequest &request) {
  if (!enabled()) {
    return std::nullopt;
  }
  try {
    auto key = Fingerprint(request);
    auto record = store_->Get(key);
    if (record && !record->Expired(clock_())) {
      hits_.fetch_add(1, std::memory_order_relaxed);
      GlobalMetrics().RecordCacheHit(false);
      return AsHit(*record, request);
    }
    if (similarity_enabled()) {
      auto similar = FindSimilar(request, Scope(request));
      if (similar) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        similarity_hits_.fetch_add(1, std::memory_order_relaxed);
        GlobalMetrics().RecordCacheHit(true);
        return similar;
      }
    }
  } catch (const std::exception &ex) {
    RecordError(ErrorCode::kCacheUnavailable, "get", ex.what());
  }
  misses_.fetch_add(1, std::memory_order_relaxed);
  GlobalMetrics().RecordCacheMiss();
  return std::nullopt;
}

std::optional<InferenceResponse>
ResponseCache::FindSimilar(const InferenceRequest &request,
                           const std::string &scope) {
  std::vector<float> query;
  try {
    query = embedder_->Embed(request.FlattenText());
  } catch (const std::exception &ex) {
    RecordError(ErrorCode::kEmbeddingFailed, "embed", ex.what());
    return std::nullopt;
  }
  auto candidates = store_->RecentInScope(scope, config_.max_similarity_scan);
  auto now = clock_();

  const CacheRecord *best = nullptr;
  double best_score = config_.similarity_threshold;
  for (const auto &candidate : candidates) {
    if (candidate.Expired(now)) {
      continue;
    }
    double score = CosineSimilarity(query, candidate.embedding);
    if (score >= best_score) {
      best_score = score;
      best = &candidate;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  log::Debug("response_cache", "Similarity hit",
             "request_id=" + request.request_id + " score=" +
                 std::to_string(best_score));
  return AsHit(*best, request);
}

void ResponseCache::Set(const InferenceRequest &request,
                        const InferenceResponse &response) {
  if (!enabled() || !response.IsSuccess() || response.cached) {
    return;
  }
  try {
    CacheRecord record;
    record.key = Fingerprint(request);
    record.scope = Scope(request);
    record.response_json = SerializeResponse(response);
    record.backend_id = response.backend_id;
    record.created_at = clock_();
    record.expires_at = record.created_at + config_.ttl;
    if (similarity_enabled()) {
      try {
        record.embedding = embedder_->Embed(request.FlattenText());
      } catch (const std::exception &ex) {
        // The exact entry is still worth keeping.
        RecordError(ErrorCode::kEmbeddingFailed, "embed", ex.what());
      }
    }
    store_->Put(record);
    writes_.fetch_add(1, std::memory_order_relaxed);
    GlobalMetrics().RecordCacheWrite();
  } catch (const std::exception &ex) {
    RecordError(ErrorCode::kCacheUnavailable, "set", ex.what());
  }
}

std::size_t ResponseCache::Invalidate(const CacheInvalidation &filter) {
  if (!store_) {
    return 0;
  }
  auto now = clock_();
  try {
    auto removed = store_->RemoveIf([&](const CacheRecord &record) {
      if (filter.backend_id && record.backend_id != *filter.backend_id) {
        return false;
      }
      if (filter.older_than && now - record.created_at < *filter.older_than) {
        return false;
      }
      return true;
    });
    log::Info("response_cache", "Invalidated entries",
              "removed=" + std::to_string(removed));
    return removed;
  } catch (const std::exception &ex) {
    RecordError(ErrorCode::kCacheUnavailable, "invalidate", ex.what());
    return 0;
  }
}

void ResponseCache::Clear() {
  if (!store_) {
    return;
  }
  try {
    store_->Clear();
  } catch (const std::exception &ex) {
    RecordError(ErrorCode::kCacheUnavailable, "clear", ex.what());
  }
}

CacheStats ResponseCache::Stats() const {
  CacheStats stats;
  stats.hits = hits_.load(std::memory_order_relaxed);
  stats.similarity_hits = similarity_hits_.load(std::memory_order_relaxed);
  stats.misses = misses_.load(std::memory_order_relaxed);
  stats.writes = writes_.load(std::memory_order_relaxed);
  stats.errors = errors_.load(std::memory_order_relaxed);
  stats.last_error = last_error_.load(std::memory_order_relaxed);
  return stats;
}

} // namespace switchyard
