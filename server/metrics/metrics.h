#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace switchyard {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000, +Inf
  static constexpr std::array<double, 8> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0};
  // Cumulative bucket counts (bucket[i] = observations within kBuckets[i] ms).
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  // Request outcomes ("success", "cached", "rate_limited", ...).
  void RecordRequest(const std::string &outcome);
  void RecordLatency(double request_ms);
  void RecordTokens(const std::string &backend, int input_tokens,
                    int output_tokens);

  // Cache.
  void RecordCacheHit(bool similarity);
  void RecordCacheMiss();
  void RecordCacheWrite();
  void RecordCacheError();

  // Rate limiting. `kind` is "requests" or "units".
  void RecordRateLimitRejection(const std::string &kind);
  void RecordRateLimitFailOpen();

  // Circuit breaker.
  void RecordCircuitTransition(const std::string &backend,
                               const std::string &to_state);
  void RecordCircuitRejection(const std::string &backend);

  // Backend attempts made by the orchestrator.
  void RecordBackendAttempt(const std::string &backend, bool success,
                            double duration_ms);
  void RecordFailover();
  // `stage` names the router filter that emptied the candidate set.
  void RecordRoutingFailure(const std::string &stage);

  // Admission queue. `event` is "enqueued", "dequeued", "expired" or
  // "rejected".
  void RecordQueueEvent(const std::string &event);
  void RecordQueueLatency(double wait_ms);
  void SetQueueDepth(int depth);

  // Snapshot of cache metrics for health reports.
  struct CacheMetrics {
    uint64_t hits{0};
    uint64_t similarity_hits{0};
    uint64_t misses{0};
    uint64_t writes{0};
    uint64_t errors{0};
  };
  CacheMetrics GetCacheMetrics() const;

  std::string RenderPrometheus() const;

private:
  using LabeledCounters = std::map<std::string, uint64_t>;

  static void Increment(std::mutex &mutex, LabeledCounters &counters,
                        const std::string &label, uint64_t delta = 1);

  // Counters.
  std::atomic<uint64_t> cache_hits_{0};
  std::atomic<uint64_t> cache_similarity_hits_{0};
  std::atomic<uint64_t> cache_misses_{0};
  std::atomic<uint64_t> cache_writes_{0};
  std::atomic<uint64_t> cache_errors_{0};
  std::atomic<uint64_t> rate_limit_fail_open_{0};
  std::atomic<uint64_t> failovers_{0};

  mutable std::mutex labeled_mutex_;
  LabeledCounters request_outcomes_;
  LabeledCounters rate_limit_rejections_;
  LabeledCounters circuit_rejections_;
  // "backend|state" -> count
  LabeledCounters circuit_transitions_;
  // "backend|result" -> count
  LabeledCounters backend_attempts_;
  LabeledCounters routing_failures_;
  LabeledCounters queue_events_;
  // backend -> (input, output)
  std::map<std::string, std::pair<uint64_t, uint64_t>> backend_tokens_;

  // Latency histograms.
  LatencyHistogram request_latency_;
  LatencyHistogram queue_latency_;
  LatencyHistogram attempt_latency_;

  // Gauges.
  std::atomic<int> queue_depth_{0};
};

MetricsRegistry &GlobalMetrics();

} // namespace switchyard
