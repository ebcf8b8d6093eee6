#include <catch2/catch_all.hpp>

#include "gateway_fixtures.h"
#include "runtime/response_cache/memory_cache_store.h"
#include "scheduler/orchestrator.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace switchyard;
using switchyard::testing::SampleCatalog;
using switchyard::testing::ScriptedAdapter;

namespace {

class RecordingSink : public UsageSink {
public:
  void Record(const UsageRecord &record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    records.push_back(record);
  }
  std::vector<UsageRecord> records;

private:
  std::mutex mutex_;
};

class ThrowingSink : public UsageSink {
public:
  void Record(const UsageRecord &) override {
    throw std::runtime_error("billing export down");
  }
};

// Fails every call and removes `victim` from the catalog on the way out.
class UnregisteringAdapter : public BackendAdapter {
public:
  UnregisteringAdapter(std::shared_ptr<BackendCatalog> catalog,
                       std::string victim)
      : catalog_(std::move(catalog)), victim_(std::move(victim)) {}

  ProviderResult Complete(const InferenceRequest &,
                          const std::string &backend_id) override {
    catalog_->Unregister(victim_);
    return ProviderResult::Failure(ErrorCode::kProviderTimeout, "timeout",
                                   backend_id);
  }
  ProviderResult Stream(const InferenceRequest &request,
                        const std::string &backend_id,
                        const StreamChunkCallback &) override {
    return Complete(request, backend_id);
  }
  AdapterHealth HealthCheck() override { return {}; }
  bool SupportsCapability(const std::string &) const override { return true; }
  bool SupportsModel(const std::string &) const override { return true; }
  std::string Name() const override { return "openai"; }

private:
  std::shared_ptr<BackendCatalog> catalog_;
  std::string victim_;
};

InferenceRequest Req(const std::string &id,
                     std::vector<std::string> capabilities = {"vision"}) {
  InferenceRequest request;
  request.request_id = id;
  request.caller_id = "agent-1";
  request.estimated_input_tokens = 1000;
  request.prompt.params.max_output_tokens = 1000;
  request.prompt.messages.push_back({"user", "Describe image " + id});
  request.requirements.capabilities = std::move(capabilities);
  return request;
}

struct GatewayFixture {
  std::shared_ptr<BackendCatalog> catalog = SampleCatalog();
  std::shared_ptr<CircuitBreaker> breaker;
  std::shared_ptr<ScriptedAdapter> anthropic =
      std::make_shared<ScriptedAdapter>("anthropic");
  std::shared_ptr<ScriptedAdapter> openai =
      std::make_shared<ScriptedAdapter>("openai");
  std::shared_ptr<ResponseCache> cache = std::make_shared<ResponseCache>(
      ResponseCacheConfig{}, std::make_shared<MemoryCacheStore>());
  std::shared_ptr<RecordingSink> usage = std::make_shared<RecordingSink>();
  std::unique_ptr<Orchestrator> orchestrator;

  explicit GatewayFixture(CircuitBreakerConfig breaker_config = {},
                          std::shared_ptr<RateLimiter> limiter = nullptr,
                          OrchestratorConfig config = {}) {
    breaker = std::make_shared<CircuitBreaker>(breaker_config);
    Orchestrator::Dependencies deps;
    deps.catalog = catalog;
    deps.breaker = breaker;
    deps.rate_limiter = std::move(limiter);
    deps.cache = cache;
    deps.usage = usage;
    orchestrator = std::make_unique<Orchestrator>(std::move(deps), config);
    REQUIRE(orchestrator->RegisterAdapter(anthropic).ok());
    REQUIRE(orchestrator->RegisterAdapter(openai).ok());
  }
};

} // namespace

// ---------------------------------------------------------------------------
// Execute
// ---------------------------------------------------------------------------

TEST_CASE("Orchestrator serves a vision request from the routed primary",
          "[orchestrator]") {
  GatewayFixture f;
  auto result = f.orchestrator->Execute(Req("r1"));
  REQUIRE(result.ok());
  REQUIRE(result.response->backend_id == "gpt-4o");
  REQUIRE(result.response->provider == "openai");
  REQUIRE(result.response->request_id == "r1");
  REQUIRE(result.response->content == "ok from gpt-4o");
  REQUIRE_FALSE(result.response->cached);
  REQUIRE(result.decision.has_value());
  REQUIRE(result.decision->primary_backend_id == "gpt-4o");
  REQUIRE(result.attempts.size() == 1);
  REQUIRE(result.attempts[0].error.ok());

  REQUIRE(f.usage->records.size() == 1);
  const auto &record = f.usage->records[0];
  REQUIRE(record.request_id == "r1");
  REQUIRE(record.caller_id == "agent-1");
  REQUIRE(record.backend_id == "gpt-4o");
  REQUIRE(record.status == "success");
  REQUIRE(record.input_tokens == 100);
  REQUIRE(record.output_tokens == 20);
  REQUIRE(record.attempts == 1);
  REQUIRE(record.cost_estimate == Catch::Approx(0.00045));
}

TEST_CASE("Orchestrator fails over to the next candidate", "[orchestrator]") {
  GatewayFixture f;
  f.openai->FailWith("gpt-4o", ErrorCode::kProviderTimeout);
  auto result = f.orchestrator->Execute(Req("r1"));
  REQUIRE(result.ok());
  REQUIRE(result.response->backend_id == "claude-sonnet");
  REQUIRE(result.attempts.size() == 2);
  REQUIRE(result.attempts[0].backend_id == "gpt-4o");
  REQUIRE(result.attempts[0].error.code == ErrorCode::kProviderTimeout);
  REQUIRE(result.attempts[1].error.ok());
  REQUIRE(f.usage->records.back().attempts == 2);
}

TEST_CASE("Orchestrator reports all backends unavailable", "[orchestrator]") {
  GatewayFixture f;
  f.openai->FailWith("gpt-4o", ErrorCode::kProviderError);
  f.anthropic->FailWith("claude-sonnet", ErrorCode::kProviderRateLimited);
  auto result = f.orchestrator->Execute(Req("r1"));
  REQUIRE_FALSE(result.ok());
  REQUIRE(result.error.code == ErrorCode::kAllBackendsUnavailable);
  REQUIRE(result.attempts.size() == 2);
  REQUIRE_FALSE(result.response.has_value());

  const auto &record = f.usage->records.back();
  REQUIRE(record.status == "all_backends_unavailable");
  REQUIRE(record.backend_id == "claude-sonnet");
  REQUIRE(record.attempts == 2);
}

TEST_CASE("Orchestrator treats a missing adapter as a failed attempt",
          "[orchestrator]") {
  GatewayFixture f;
  // No "local" adapter: llama-local ranks first for plain text.
  auto result = f.orchestrator->Execute(Req("r1", {}));
  REQUIRE(result.ok());
  REQUIRE(result.decision->primary_backend_id == "llama-local");
  REQUIRE(result.attempts[0].error.code == ErrorCode::kProviderNotConfigured);
  REQUIRE(result.response->backend_id == "claude-haiku");
  // A configuration gap is not held against the backend's circuit.
  REQUIRE(f.breaker->Snapshot("llama-local").total_failures == 0);
}

TEST_CASE("Orchestrator records adapter exceptions as provider errors",
          "[orchestrator]") {
  GatewayFixture f;
  f.openai->ThrowFor("gpt-4o");
  auto result = f.orchestrator->Execute(Req("r1"));
  REQUIRE(result.ok());
  REQUIRE(result.attempts[0].error.code == ErrorCode::kProviderError);
  REQUIRE(result.response->backend_id == "claude-sonnet");
}

TEST_CASE("Orchestrator fails over when an adapter throws a foreign type",
          "[orchestrator]") {
  GatewayFixture f;
  f.openai->ThrowForeignFor("gpt-4o");
  GatewayResult result;
  REQUIRE_NOTHROW(result = f.orchestrator->Execute(Req("r1")));
  REQUIRE(result.ok());
  REQUIRE(result.attempts[0].error.code == ErrorCode::kProviderError);
  REQUIRE(result.response->backend_id == "claude-sonnet");
  REQUIRE(f.breaker->Snapshot("gpt-4o").total_failures == 1);
}

TEST_CASE("Orchestrator routes around a circuit it opened", "[orchestrator]") {
  CircuitBreakerConfig config;
  config.failure_threshold = 1;
  GatewayFixture f(config);
  f.openai->FailWith("gpt-4o", ErrorCode::kProviderError);

  REQUIRE(f.orchestrator->Execute(Req("r1")).ok());
  REQUIRE(f.breaker->State("gpt-4o") == CircuitState::kOpen);

  auto second = f.orchestrator->Execute(Req("r2"));
  REQUIRE(second.ok());
  REQUIRE(second.decision->primary_backend_id == "claude-sonnet");
  REQUIRE(second.attempts.size() == 1);
  REQUIRE(f.openai->Calls().size() == 1);
}

TEST_CASE("Orchestrator skips fallbacks removed from the catalog",
          "[orchestrator]") {
  GatewayFixture f;
  REQUIRE(f.orchestrator
              ->RegisterAdapter(std::make_shared<UnregisteringAdapter>(
                  f.catalog, "claude-sonnet"))
              .ok());
  auto result = f.orchestrator->Execute(Req("r1"));
  REQUIRE(result.error.code == ErrorCode::kAllBackendsUnavailable);
  REQUIRE(result.attempts.size() == 1);
  REQUIRE(f.anthropic->Calls().empty());
}

TEST_CASE("Orchestrator returns cached responses", "[orchestrator]") {
  GatewayFixture f;
  REQUIRE(f.orchestrator->Execute(Req("same")).ok());

  auto again = Req("same");
  again.request_id = "second";
  auto result = f.orchestrator->Execute(again);
  REQUIRE(result.ok());
  REQUIRE(result.response->cached);
  REQUIRE(result.response->latency_ms == 0);
  REQUIRE(result.response->request_id == "second");
  REQUIRE(result.attempts.empty());
  REQUIRE_FALSE(result.decision.has_value());
  REQUIRE(f.openai->Calls().size() == 1);

  const auto &record = f.usage->records.back();
  REQUIRE(record.cached);
  REQUIRE(record.cost_estimate == 0.0);
  REQUIRE(record.attempts == 0);
}

TEST_CASE("Orchestrator skips the cache when the request opts out",
          "[orchestrator]") {
  GatewayFixture f;
  auto request = Req("r1");
  request.enable_cache = false;
  REQUIRE(f.orchestrator->Execute(request).ok());
  REQUIRE(f.orchestrator->Execute(request).ok());
  REQUIRE(f.openai->Calls().size() == 2);
  REQUIRE(f.cache->Stats().writes == 0);
}

TEST_CASE("Orchestrator enforces the gateway rate limit", "[orchestrator]") {
  RateLimits limits;
  limits.requests_per_minute = 1;
  limits.units_per_minute = 0;
  GatewayFixture f({}, std::make_shared<RateLimiter>(limits));

  REQUIRE(f.orchestrator->Execute(Req("r1")).ok());
  auto limited = f.orchestrator->Execute(Req("r2"));
  REQUIRE(limited.error.code == ErrorCode::kRequestRateExceeded);
  REQUIRE(limited.attempts.empty());
  REQUIRE(f.openai->Calls().size() == 1);
  REQUIRE(f.usage->records.back().status == "request_rate_exceeded");

  auto other = Req("r3");
  other.caller_id = "agent-2";
  REQUIRE(f.orchestrator->Execute(other).ok());
}

TEST_CASE("Orchestrator per-backend rate limits fail over", "[orchestrator]") {
  OrchestratorConfig config;
  config.rate_limit_scope = RateLimitScope::kBackend;
  GatewayFixture f({}, std::make_shared<RateLimiter>(), config);
  auto gpt = *f.catalog->Get("gpt-4o");
  gpt.requests_per_minute = 1;
  REQUIRE(f.catalog->Unregister("gpt-4o").ok());
  REQUIRE(f.catalog->Register(gpt).ok());

  REQUIRE(f.orchestrator->Execute(Req("r1")).response->backend_id == "gpt-4o");
  auto second = f.orchestrator->Execute(Req("r2"));
  REQUIRE(second.ok());
  REQUIRE(second.attempts[0].error.code == ErrorCode::kRequestRateExceeded);
  REQUIRE(second.response->backend_id == "claude-sonnet");
}

TEST_CASE("Orchestrator surfaces routing errors", "[orchestrator]") {
  GatewayFixture f;
  auto result = f.orchestrator->Execute(Req("r1", {"audio"}));
  REQUIRE(result.error.code == ErrorCode::kNoCapableBackend);
  REQUIRE(result.attempts.empty());
  REQUIRE(f.usage->records.back().status == "no_capable_backend");
}

TEST_CASE("Orchestrator honours deadline and cancellation", "[orchestrator]") {
  GatewayFixture f;
  auto expired = Req("r1");
  expired.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);
  REQUIRE(f.orchestrator->Execute(expired).error.code ==
          ErrorCode::kDeadlineExceeded);

  auto cancelled = Req("r2");
  cancelled.cancellation_flag = std::make_shared<std::atomic<bool>>(true);
  REQUIRE(f.orchestrator->Execute(cancelled).error.code ==
          ErrorCode::kCancelled);
  REQUIRE(f.openai->Calls().empty());
}

TEST_CASE("Orchestrator survives a failing usage sink", "[orchestrator]") {
  Orchestrator::Dependencies deps;
  deps.catalog = SampleCatalog();
  deps.usage = std::make_shared<ThrowingSink>();
  Orchestrator orchestrator(std::move(deps));
  REQUIRE(orchestrator
              .RegisterAdapter(std::make_shared<ScriptedAdapter>("openai"))
              .ok());
  REQUIRE(orchestrator.Execute(Req("r1")).ok());
}

TEST_CASE("Orchestrator rejects invalid wiring", "[orchestrator]") {
  REQUIRE_THROWS_AS(Orchestrator(Orchestrator::Dependencies{}),
                    std::invalid_argument);
  GatewayFixture f;
  REQUIRE(f.orchestrator->RegisterAdapter(nullptr).code ==
          ErrorCode::kInvalidConfig);
  REQUIRE(f.orchestrator->Adapter("openai") == f.openai);
  REQUIRE(f.orchestrator->Adapter("mistral") == nullptr);
}

// ---------------------------------------------------------------------------
// Stream
// ---------------------------------------------------------------------------

TEST_CASE("Orchestrator streams chunks and bypasses the cache",
          "[orchestrator][stream]") {
  GatewayFixture f;
  f.openai->SetStreamChunks({"Hel", "lo"});
  std::vector<StreamChunk> chunks;
  auto result = f.orchestrator->Stream(Req("r1"), std::nullopt,
                                       [&](const StreamChunk &chunk) {
                                         chunks.push_back(chunk);
                                         return true;
                                       });
  REQUIRE(result.ok());
  REQUIRE(result.response->content == "Hello");
  REQUIRE(chunks.size() == 3);
  REQUIRE(chunks.back().is_final);
  REQUIRE(f.cache->Stats().writes == 0);
  REQUIRE(f.cache->Stats().misses == 0);
  REQUIRE(f.usage->records.size() == 1);
}

TEST_CASE("Orchestrator stream fails over before the first chunk",
          "[orchestrator][stream]") {
  GatewayFixture f;
  f.openai->FailWith("gpt-4o", ErrorCode::kProviderError);
  f.anthropic->SetStreamChunks({"from sonnet"});
  std::string text;
  auto result = f.orchestrator->Stream(Req("r1"), std::nullopt,
                                       [&](const StreamChunk &chunk) {
                                         text += chunk.content;
                                         return true;
                                       });
  REQUIRE(result.ok());
  REQUIRE(result.response->backend_id == "claude-sonnet");
  REQUIRE(text == "from sonnet");
  REQUIRE(result.attempts.size() == 2);
}

TEST_CASE("Orchestrator stream does not fail over after output",
          "[orchestrator][stream]") {
  GatewayFixture f;
  f.openai->SetStreamChunks({"partial"});
  f.openai->FailWith("gpt-4o", ErrorCode::kProviderError);
  auto result = f.orchestrator->Stream(
      Req("r1"), std::nullopt, [](const StreamChunk &) { return true; });
  REQUIRE(result.error.code == ErrorCode::kProviderStreamError);
  REQUIRE(result.attempts.size() == 1);
  REQUIRE(f.anthropic->Calls().empty());
}

TEST_CASE("Orchestrator stream stops when the caller goes away",
          "[orchestrator][stream]") {
  GatewayFixture f;
  f.openai->SetStreamChunks({"a", "b", "c"});
  int seen = 0;
  auto result = f.orchestrator->Stream(Req("r1"), std::nullopt,
                                       [&](const StreamChunk &) {
                                         ++seen;
                                         return false;
                                       });
  REQUIRE(result.error.code == ErrorCode::kCancelled);
  REQUIRE(seen == 1);
  REQUIRE(f.anthropic->Calls().empty());
}

TEST_CASE("Orchestrator caller-stopped streams leave circuits closed",
          "[orchestrator][stream]") {
  CircuitBreakerConfig config;
  config.failure_threshold = 3;
  GatewayFixture f(config);
  f.openai->SetStreamChunks({"a", "b"});
  f.anthropic->SetStreamChunks({"a", "b"});

  for (int i = 0; i < 12; ++i) {
    auto result = f.orchestrator->Stream(
        Req("s" + std::to_string(i)), std::nullopt,
        [](const StreamChunk &) { return false; });
    REQUIRE(result.error.code == ErrorCode::kCancelled);
    REQUIRE(result.attempts.size() == 1);
  }
  auto snap = f.breaker->Snapshot("gpt-4o");
  REQUIRE(snap.state == CircuitState::kClosed);
  REQUIRE(snap.total_failures == 0);
  REQUIRE(snap.total_successes == 0);
  REQUIRE(f.breaker->State("claude-sonnet") == CircuitState::kClosed);

  auto next = f.orchestrator->Execute(Req("after"));
  REQUIRE(next.ok());
  REQUIRE(next.response->backend_id == "gpt-4o");
}

// ---------------------------------------------------------------------------
// Health
// ---------------------------------------------------------------------------

TEST_CASE("Orchestrator health aggregates providers and circuits",
          "[orchestrator]") {
  GatewayFixture f;
  f.openai->SetHealth(AdapterHealthStatus::kUnhealthy);
  f.breaker->ForceOpen("gpt-4o");

  auto health = f.orchestrator->CheckHealth();
  REQUIRE(health.healthy);
  REQUIRE(health.providers.size() == 2);
  REQUIRE(health.providers[0].provider == "anthropic");
  REQUIRE(health.providers[1].health.status ==
          AdapterHealthStatus::kUnhealthy);
  REQUIRE(health.circuit_stats.open == 1);
  REQUIRE(health.cache.has_value());
  REQUIRE(health.backends == 4);
  REQUIRE_FALSE(health.queue.has_value());

  f.anthropic->SetHealth(AdapterHealthStatus::kUnhealthy);
  REQUIRE_FALSE(f.orchestrator->CheckHealth().healthy);
}
