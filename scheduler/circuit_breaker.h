#pragma once

#include "runtime/backends/backend_adapter.h"
#include "scheduler/gateway_error.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchyard {

enum class CircuitState { kClosed, kOpen, kHalfOpen };

const char *CircuitStateName(CircuitState state);

struct CircuitBreakerConfig {
  // Consecutive failures that open a closed circuit.
  int failure_threshold{5};
  // Time an open circuit waits before admitting trial calls.
  std::chrono::milliseconds recovery_timeout{std::chrono::seconds(60)};
  // Concurrent trial calls admitted while half-open; the same number of
  // consecutive successes closes the circuit.
  int half_open_max_calls{3};
};

struct CircuitSnapshot {
  using TimePoint = std::chrono::steady_clock::time_point;

  std::string backend_id;
  CircuitState state{CircuitState::kClosed};
  int consecutive_failures{0};
  uint64_t total_failures{0};
  uint64_t total_successes{0};
  uint64_t total_rejections{0};
  std::optional<TimePoint> last_failure;
  std::optional<TimePoint> last_success;
  std::optional<TimePoint> open_since;
  int half_open_in_flight{0};
  int half_open_successes{0};
};

struct CircuitStats {
  std::size_t closed{0};
  std::size_t open{0};
  std::size_t half_open{0};
};

// CircuitBreaker keeps one circuit per backend id.
//
// State machine:
//   Closed   -> Open      failure_threshold consecutive failures
//   Open     -> HalfOpen  first query after recovery_timeout (lazy)
//   HalfOpen -> Closed    half_open_max_calls consecutive trial successes
//   HalfOpen -> Open      any failure
//
// Thread safety: transitions happen under a per-backend mutex; the backend
// map is guarded by a shared mutex held only to find or create entries.
class CircuitBreaker {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  explicit CircuitBreaker(CircuitBreakerConfig config = {},
                          ClockFn clock = {});

  // Current state; performs the lazy Open -> HalfOpen transition.
  CircuitState State(const std::string &backend_id);
  CircuitSnapshot Snapshot(const std::string &backend_id);
  // Snapshots of every backend seen so far, sorted by id.
  std::vector<CircuitSnapshot> Snapshots();

  // Runs `operation` when the circuit admits the call and records its
  // outcome. Open circuits reject with kCircuitOpen without invoking the
  // operation; half-open circuits beyond the trial cap reject with
  // kHalfOpenTrialsExhausted. A result that is not ok, or any exception
  // thrown by the operation, counts as a failure; exceptions come back as
  // kProviderError. A kCancelled result is not counted either way.
  ProviderResult Call(const std::string &backend_id,
                      const std::function<ProviderResult()> &operation);

  void Reset(const std::string &backend_id);
  void ForceOpen(const std::string &backend_id);

  CircuitStats Stats();
  const CircuitBreakerConfig &config() const { return config_; }

private:
  struct Entry {
    std::mutex mutex;
    CircuitSnapshot snapshot; // guarded by mutex
  };

  std::shared_ptr<Entry> GetEntry(const std::string &backend_id);
  Clock::time_point Now() const { return clock_ ? clock_() : Clock::now(); }

  // All *Locked helpers require entry.mutex.
  void MaybeHalfOpenLocked(Entry &entry, Clock::time_point now);
  void TransitionLocked(Entry &entry, CircuitState to, Clock::time_point now);
  void RecordSuccessLocked(Entry &entry, bool trial, Clock::time_point now);
  void RecordFailureLocked(Entry &entry, Clock::time_point now);
  void ReleaseTrialLocked(Entry &entry, bool trial);

  CircuitBreakerConfig config_;
  ClockFn clock_;

  std::shared_mutex entries_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace switchyard
