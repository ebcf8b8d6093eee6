#include <catch2/catch_all.hpp>

#include "runtime/response_cache/hashing_embedder.h"
#include "runtime/response_cache/memory_cache_store.h"
#include "runtime/response_cache/response_cache.h"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace switchyard;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
  CacheRecord::TimePoint now{std::chrono::system_clock::now()};
  ResponseCache::ClockFn Fn() {
    return [this] { return now; };
  }
};

class ThrowingStore : public CacheStore {
public:
  std::optional<CacheRecord> Get(const std::string &) override {
    throw std::runtime_error("store down");
  }
  void Put(const CacheRecord &) override {
    throw std::runtime_error("store down");
  }
  std::vector<CacheRecord> RecentInScope(const std::string &,
                                         std::size_t) override {
    throw std::runtime_error("store down");
  }
  std::size_t
  RemoveIf(const std::function<bool(const CacheRecord &)> &) override {
    throw std::runtime_error("store down");
  }
  void Clear() override { throw std::runtime_error("store down"); }
  std::size_t Size() override { return 0; }
};

class ThrowingEmbedder : public Embedder {
public:
  std::vector<float> Embed(const std::string &) override {
    throw std::runtime_error("embedder down");
  }
  std::string Name() const override { return "throwing"; }
};

InferenceRequest Request(const std::string &id, const std::string &text) {
  InferenceRequest request;
  request.request_id = id;
  request.caller_id = "agent-1";
  request.prompt.messages.push_back({"user", text});
  request.requirements.capabilities = {"text"};
  return request;
}

InferenceResponse Response(const std::string &request_id) {
  InferenceResponse response;
  response.request_id = request_id;
  response.backend_id = "claude-sonnet";
  response.provider = "anthropic";
  response.content = "Paris";
  response.token_usage = {12, 3, 0};
  response.latency_ms = 420;
  response.finish_reason = "stop";
  return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Fingerprints
// ---------------------------------------------------------------------------

TEST_CASE("Fingerprint is stable and content sensitive", "[cache]") {
  auto a = Request("r1", "What is the capital of France?");
  auto b = Request("r2", "What is the capital of France?");
  REQUIRE(ResponseCache::Fingerprint(a) == ResponseCache::Fingerprint(b));
  REQUIRE(ResponseCache::Fingerprint(a).size() == 64);

  auto c = Request("r3", "What is the capital of Spain?");
  REQUIRE(ResponseCache::Fingerprint(a) != ResponseCache::Fingerprint(c));

  auto d = a;
  d.prompt.params.temperature = 0.1;
  REQUIRE(ResponseCache::Fingerprint(a) != ResponseCache::Fingerprint(d));
  REQUIRE(ResponseCache::Scope(a) != ResponseCache::Scope(d));
}

TEST_CASE("Fingerprint ignores capability order", "[cache]") {
  auto a = Request("r1", "describe");
  a.requirements.capabilities = {"vision", "text"};
  auto b = Request("r2", "describe");
  b.requirements.capabilities = {"text", "vision"};
  REQUIRE(ResponseCache::Fingerprint(a) == ResponseCache::Fingerprint(b));
  REQUIRE(ResponseCache::Scope(a) == ResponseCache::Scope(b));
}

TEST_CASE("Response serialisation keeps every field", "[cache]") {
  auto response = Response("r1");
  response.metadata["model"] = "claude-3-5-sonnet";
  auto back =
      ResponseCache::DeserializeResponse(ResponseCache::SerializeResponse(response));
  REQUIRE(back.backend_id == "claude-sonnet");
  REQUIRE(back.provider == "anthropic");
  REQUIRE(back.content == "Paris");
  REQUIRE(back.token_usage.input_tokens == 12);
  REQUIRE(back.token_usage.output_tokens == 3);
  REQUIRE(back.finish_reason == "stop");
  REQUIRE(back.metadata.at("model") == "claude-3-5-sonnet");
}

// ---------------------------------------------------------------------------
// Exact hits
// ---------------------------------------------------------------------------

TEST_CASE("Exact hit returns a cached copy for the new request", "[cache]") {
  FakeClock clock;
  ResponseCache cache({}, std::make_shared<MemoryCacheStore>(), nullptr,
                      clock.Fn());
  auto first = Request("r1", "What is the capital of France?");
  REQUIRE_FALSE(cache.Get(first).has_value());
  cache.Set(first, Response("r1"));

  auto second = Request("r2", "What is the capital of France?");
  auto hit = cache.Get(second);
  REQUIRE(hit.has_value());
  REQUIRE(hit->cached);
  REQUIRE(hit->latency_ms == 0);
  REQUIRE(hit->request_id == "r2");
  REQUIRE(hit->content == "Paris");

  auto stats = cache.Stats();
  REQUIRE(stats.hits == 1);
  REQUIRE(stats.misses == 1);
  REQUIRE(stats.writes == 1);
  REQUIRE(stats.hit_rate() == Catch::Approx(0.5));
}

TEST_CASE("Entries expire after the TTL", "[cache]") {
  FakeClock clock;
  ResponseCacheConfig config;
  config.ttl = 60s;
  auto store = std::make_shared<MemoryCacheStore>(100, [&clock] {
    return clock.now;
  });
  ResponseCache cache(config, store, nullptr, clock.Fn());
  auto request = Request("r1", "hello");
  cache.Set(request, Response("r1"));
  REQUIRE(cache.Get(request).has_value());
  clock.now += 61s;
  REQUIRE_FALSE(cache.Get(request).has_value());
}

TEST_CASE("Only successful responses are written", "[cache]") {
  ResponseCache cache({}, std::make_shared<MemoryCacheStore>());
  auto request = Request("r1", "hello");
  auto response = Response("r1");
  response.status = ResponseStatus::kFiltered;
  cache.Set(request, response);
  REQUIRE(cache.Stats().writes == 0);
  REQUIRE_FALSE(cache.Get(request).has_value());
}

TEST_CASE("Disabled cache never hits", "[cache]") {
  ResponseCacheConfig config;
  config.enabled = false;
  ResponseCache cache(config, std::make_shared<MemoryCacheStore>());
  auto request = Request("r1", "hello");
  cache.Set(request, Response("r1"));
  REQUIRE_FALSE(cache.Get(request).has_value());
  REQUIRE(cache.Stats().writes == 0);
}

// ---------------------------------------------------------------------------
// Similarity hits
// ---------------------------------------------------------------------------

TEST_CASE("Similarity hit for a near-duplicate in the same scope", "[cache]") {
  ResponseCacheConfig config;
  config.similarity_enabled = true;
  config.similarity_threshold = 0.95;
  ResponseCache cache(config, std::make_shared<MemoryCacheStore>(),
                      std::make_shared<HashingEmbedder>());
  REQUIRE(cache.similarity_enabled());

  cache.Set(Request("r1", "What is the capital of France?"), Response("r1"));
  // Same words after normalisation, different bytes.
  auto hit = cache.Get(Request("r2", "what is the capital of france"));
  REQUIRE(hit.has_value());
  REQUIRE(hit->request_id == "r2");
  REQUIRE(hit->cached);
  REQUIRE(cache.Stats().similarity_hits == 1);
}

TEST_CASE("Similarity requires a matching scope and threshold", "[cache]") {
  ResponseCacheConfig config;
  config.similarity_enabled = true;
  ResponseCache cache(config, std::make_shared<MemoryCacheStore>(),
                      std::make_shared<HashingEmbedder>());
  cache.Set(Request("r1", "What is the capital of France?"), Response("r1"));

  auto other_scope = Request("r2", "what is the capital of france");
  other_scope.requirements.capabilities = {"text", "vision"};
  REQUIRE_FALSE(cache.Get(other_scope).has_value());

  REQUIRE_FALSE(
      cache.Get(Request("r3", "write a haiku about autumn leaves")).has_value());
  REQUIRE(cache.Stats().similarity_hits == 0);
}

TEST_CASE("Similarity without an embedder is disabled", "[cache]") {
  ResponseCacheConfig config;
  config.similarity_enabled = true;
  ResponseCache cache(config, std::make_shared<MemoryCacheStore>());
  REQUIRE_FALSE(cache.similarity_enabled());
}

// ---------------------------------------------------------------------------
// Failures and invalidation
// ---------------------------------------------------------------------------

TEST_CASE("Store failures degrade to misses", "[cache]") {
  ResponseCache cache({}, std::make_shared<ThrowingStore>());
  auto request = Request("r1", "hello");
  REQUIRE_NOTHROW(cache.Set(request, Response("r1")));
  std::optional<InferenceResponse> got;
  REQUIRE_NOTHROW(got = cache.Get(request));
  REQUIRE_FALSE(got.has_value());
  REQUIRE(cache.Invalidate({}) == 0);
  REQUIRE_NOTHROW(cache.Clear());
  auto stats = cache.Stats();
  REQUIRE(stats.errors == 4);
  REQUIRE(stats.last_error == ErrorCode::kCacheUnavailable);
  REQUIRE(stats.misses == 1);
}

TEST_CASE("Embedder failure still keeps the exact entry", "[cache]") {
  ResponseCacheConfig config;
  config.similarity_enabled = true;
  ResponseCache cache(config, std::make_shared<MemoryCacheStore>(),
                      std::make_shared<ThrowingEmbedder>());
  auto request = Request("r1", "hello");
  cache.Set(request, Response("r1"));
  REQUIRE(cache.Stats().writes == 1);
  REQUIRE(cache.Get(request).has_value());

  // A miss needs the embedder and fails open.
  REQUIRE_FALSE(cache.Get(Request("r2", "goodbye")).has_value());
  REQUIRE(cache.Stats().errors == 2);
  REQUIRE(cache.Stats().last_error == ErrorCode::kEmbeddingFailed);
}

TEST_CASE("Invalidate by backend and by age", "[cache]") {
  FakeClock clock;
  auto store = std::make_shared<MemoryCacheStore>(100, [&clock] {
    return clock.now;
  });
  ResponseCache cache({}, store, nullptr, clock.Fn());

  cache.Set(Request("r1", "one"), Response("r1"));
  auto other = Response("r2");
  other.backend_id = "gpt-4o";
  cache.Set(Request("r2", "two"), other);
  clock.now += 120s;
  cache.Set(Request("r3", "three"), Response("r3"));
  REQUIRE(store->Size() == 3);

  CacheInvalidation by_backend;
  by_backend.backend_id = "gpt-4o";
  REQUIRE(cache.Invalidate(by_backend) == 1);

  CacheInvalidation by_age;
  by_age.older_than = 60s;
  REQUIRE(cache.Invalidate(by_age) == 1);
  REQUIRE(store->Size() == 1);
  REQUIRE(cache.Get(Request("r4", "three")).has_value());

  cache.Clear();
  REQUIRE(store->Size() == 0);
}
