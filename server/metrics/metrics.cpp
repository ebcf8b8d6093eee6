#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace switchyard {

namespace {

MetricsRegistry g_metrics;

std::pair<std::string, std::string> SplitLabel(const std::string &key) {
  auto pos = key.find('|');
  if (pos == std::string::npos) {
    return {key, ""};
  }
  return {key.substr(0, pos), key.substr(pos + 1)};
}

void RenderHistogram(std::ostringstream &out, const std::string &name,
                     const std::string &help, const LatencyHistogram &hist) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << hist.counts[i].load()
        << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} "
      << hist.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum " << hist.sum_ms.load() << "\n";
  out << name << "_count " << hist.total.load() << "\n";
}

void RenderHeader(std::ostringstream &out, const std::string &name,
                  const std::string &help, const char *type = "counter") {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " " << type << "\n";
}

} // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  // +Inf bucket always increments.
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::Increment(std::mutex &mutex, LabeledCounters &counters,
                                const std::string &label, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mutex);
  counters[label] += delta;
}

void MetricsRegistry::RecordRequest(const std::string &outcome) {
  Increment(labeled_mutex_, request_outcomes_, outcome);
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void MetricsRegistry::RecordTokens(const std::string &backend,
                                   int input_tokens, int output_tokens) {
  std::lock_guard<std::mutex> lock(labeled_mutex_);
  auto &tokens = backend_tokens_[backend];
  tokens.first += static_cast<uint64_t>(std::max(input_tokens, 0));
  tokens.second += static_cast<uint64_t>(std::max(output_tokens, 0));
}

void MetricsRegistry::RecordCacheHit(bool similarity) {
  cache_hits_.fetch_add(1, std::memory_order_relaxed);
  if (similarity) {
    cache_similarity_hits_.fetch_add(1, std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordCacheMiss() {
  cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordCacheWrite() {
  cache_writes_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordCacheError() {
  cache_errors_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRateLimitRejection(const std::string &kind) {
  Increment(labeled_mutex_, rate_limit_rejections_, kind);
}

void MetricsRegistry::RecordRateLimitFailOpen() {
  rate_limit_fail_open_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordCircuitTransition(const std::string &backend,
                                              const std::string &to_state) {
  Increment(labeled_mutex_, circuit_transitions_, backend + "|" + to_state);
}

void MetricsRegistry::RecordCircuitRejection(const std::string &backend) {
  Increment(labeled_mutex_, circuit_rejections_, backend);
}

void MetricsRegistry::RecordBackendAttempt(const std::string &backend,
                                           bool success, double duration_ms) {
  Increment(labeled_mutex_, backend_attempts_,
            backend + (success ? "|success" : "|failure"));
  attempt_latency_.Record(duration_ms);
}

void MetricsRegistry::RecordFailover() {
  failovers_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRoutingFailure(const std::string &stage) {
  Increment(labeled_mutex_, routing_failures_, stage);
}

void MetricsRegistry::RecordQueueEvent(const std::string &event) {
  Increment(labeled_mutex_, queue_events_, event);
}

void MetricsRegistry::RecordQueueLatency(double wait_ms) {
  queue_latency_.Record(wait_ms);
}

void MetricsRegistry::SetQueueDepth(int depth) {
  queue_depth_.store(depth, std::memory_order_relaxed);
}

MetricsRegistry::CacheMetrics MetricsRegistry::GetCacheMetrics() const {
  CacheMetrics m;
  m.hits = cache_hits_.load();
  m.similarity_hits = cache_similarity_hits_.load();
  m.misses = cache_misses_.load();
  m.writes = cache_writes_.load();
  m.errors = cache_errors_.load();
  return m;
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;
  std::lock_guard<std::mutex> lock(labeled_mutex_);

  // --- Requests ---
  RenderHeader(out, "switchyard_requests_total",
               "Gateway requests by outcome");
  for (const auto &[outcome, count] : request_outcomes_) {
    out << "switchyard_requests_total{outcome=\"" << outcome << "\"} "
        << count << "\n";
  }

  RenderHeader(out, "switchyard_input_tokens_total",
               "Input tokens reported by backends");
  for (const auto &[backend, tokens] : backend_tokens_) {
    out << "switchyard_input_tokens_total{backend=\"" << backend << "\"} "
        << tokens.first << "\n";
  }
  RenderHeader(out, "switchyard_output_tokens_total",
               "Output tokens reported by backends");
  for (const auto &[backend, tokens] : backend_tokens_) {
    out << "switchyard_output_tokens_total{backend=\"" << backend << "\"} "
        << tokens.second << "\n";
  }

  // --- Cache ---
  RenderHeader(out, "switchyard_cache_hits_total",
               "Response cache hits (exact and similarity)");
  out << "switchyard_cache_hits_total " << cache_hits_.load() << "\n";
  RenderHeader(out, "switchyard_cache_similarity_hits_total",
               "Response cache hits served by embedding similarity");
  out << "switchyard_cache_similarity_hits_total "
      << cache_similarity_hits_.load() << "\n";
  RenderHeader(out, "switchyard_cache_misses_total", "Response cache misses");
  out << "switchyard_cache_misses_total " << cache_misses_.load() << "\n";
  RenderHeader(out, "switchyard_cache_writes_total", "Response cache writes");
  out << "switchyard_cache_writes_total " << cache_writes_.load() << "\n";
  RenderHeader(out, "switchyard_cache_errors_total",
               "Response cache store or embedding failures");
  out << "switchyard_cache_errors_total " << cache_errors_.load() << "\n";

  // --- Rate limiting ---
  RenderHeader(out, "switchyard_rate_limit_rejections_total",
               "Requests rejected by the rate limiter");
  for (const auto &[kind, count] : rate_limit_rejections_) {
    out << "switchyard_rate_limit_rejections_total{bucket=\"" << kind
        << "\"} " << count << "\n";
  }
  RenderHeader(out, "switchyard_rate_limit_fail_open_total",
               "Requests allowed because the bucket store failed");
  out << "switchyard_rate_limit_fail_open_total "
      << rate_limit_fail_open_.load() << "\n";

  // --- Circuit breaker ---
  RenderHeader(out, "switchyard_circuit_transitions_total",
               "Circuit state transitions per backend");
  for (const auto &[key, count] : circuit_transitions_) {
    auto [backend, state] = SplitLabel(key);
    out << "switchyard_circuit_transitions_total{backend=\"" << backend
        << "\",state=\"" << state << "\"} " << count << "\n";
  }
  RenderHeader(out, "switchyard_circuit_rejections_total",
               "Calls rejected by an open or saturated circuit");
  for (const auto &[backend, count] : circuit_rejections_) {
    out << "switchyard_circuit_rejections_total{backend=\"" << backend
        << "\"} " << count << "\n";
  }

  // --- Backends ---
  RenderHeader(out, "switchyard_backend_attempts_total",
               "Backend calls made by the orchestrator");
  for (const auto &[key, count] : backend_attempts_) {
    auto [backend, result] = SplitLabel(key);
    out << "switchyard_backend_attempts_total{backend=\"" << backend
        << "\",result=\"" << result << "\"} " << count << "\n";
  }
  RenderHeader(out, "switchyard_failovers_total",
               "Attempts moved on to a fallback backend");
  out << "switchyard_failovers_total " << failovers_.load() << "\n";
  RenderHeader(out, "switchyard_routing_failures_total",
               "Routing failures by filter stage");
  for (const auto &[stage, count] : routing_failures_) {
    out << "switchyard_routing_failures_total{stage=\"" << stage << "\"} "
        << count << "\n";
  }

  // --- Queue ---
  RenderHeader(out, "switchyard_queue_events_total",
               "Admission queue events");
  for (const auto &[event, count] : queue_events_) {
    out << "switchyard_queue_events_total{event=\"" << event << "\"} "
        << count << "\n";
  }
  RenderHeader(out, "switchyard_queue_depth", "Requests waiting in the queue",
               "gauge");
  out << "switchyard_queue_depth " << queue_depth_.load() << "\n";

  // --- Latency ---
  RenderHistogram(out, "switchyard_request_duration_ms",
                  "End-to-end gateway request latency", request_latency_);
  RenderHistogram(out, "switchyard_backend_attempt_duration_ms",
                  "Latency of individual backend attempts", attempt_latency_);
  RenderHistogram(out, "switchyard_queue_wait_duration_ms",
                  "Time requests spend in the admission queue",
                  queue_latency_);

  return out.str();
}

MetricsRegistry &GlobalMetrics() { return g_metrics; }

} // namespace switchyard
