#include "scheduler/circuit_breaker.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>
#include <exception>

namespace switchyard {

const char *CircuitStateName(CircuitState state) {
  switch (state) {
  case CircuitState::kClosed:
    return "closed";
  case CircuitState::kOpen:
    return "open";
  case CircuitState::kHalfOpen:
    return "half_open";
  }
  return "closed";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
  if (config_.failure_threshold < 1) {
    config_.failure_threshold = 1;
  }
  if (config_.half_open_max_calls < 1) {
    config_.half_open_max_calls = 1;
  }
}

std::shared_ptr<CircuitBreaker::Entry>
CircuitBreaker::GetEntry(const std::string &backend_id) {
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    auto it = entries_.find(backend_id);
    if (it != entries_.end()) {
      return it->second;
    }
  }
  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  auto [it, inserted] = entries_.try_emplace(backend_id, nullptr);
  if (inserted) {
    it->second = std::make_shared<Entry>();
    it->second->snapshot.backend_id = backend_id;
  }
  return it->second;
}

CircuitState CircuitBreaker::State(const std::string &backend_id) {
  auto entry = GetEntry(backend_id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  MaybeHalfOpenLocked(*entry, Now());
  return entry->snapshot.state;
}

CircuitSnapshot CircuitBreaker::Snapshot(const std::string &backend_id) {
  auto entry = GetEntry(backend_id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  MaybeHalfOpenLocked(*entry, Now());
  return entry->snapshot;
}

std::vector<CircuitSnapshot> CircuitBreaker::Snapshots() {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    entries.reserve(entries_.size());
    for (const auto &[id, entry] : entries_) {
      entries.push_back(entry);
    }
  }
  auto now = Now();
  std::vector<CircuitSnapshot> out;
  out.reserve(entries.size());
  for (const auto &entry : entries) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    MaybeHalfOpenLocked(*entry, now);
    out.push_back(entry->snapshot);
  }
  std::sort(out.begin(), out.end(),
            [](const CircuitSnapshot &a, const CircuitSnapshot &b) {
              return a.backend_id < b.backend_id;
            });
  return out;
}

ProviderResult
CircuitBreaker::Call(const std::string &backend_id,
                     const std::function<ProviderResult()> &operation) {
  auto entry = GetEntry(backend_id);
  bool trial = false;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    auto &snap = entry->snapshot;
    MaybeHalfOpenLocked(*entry, Now());
    if (snap.state == CircuitState::kOpen) {
      ++snap.total_rejections;
      GlobalMetrics().RecordCircuitRejection(backend_id);
      return ProviderResult::Failure(ErrorCode::kCircuitOpen,
                                     "Circuit open for backend",
                                     "backend=" + backend_id);
    }
    if (snap.state == CircuitState::kHalfOpen) {
      if (snap.half_open_in_flight >= config_.half_open_max_calls) {
        ++snap.total_rejections;
        GlobalMetrics().RecordCircuitRejection(backend_id);
        return ProviderResult::Failure(
            ErrorCode::kHalfOpenTrialsExhausted,
            "Half-open trial calls exhausted",
            "backend=" + backend_id + " in_flight=" +
                std::to_string(snap.half_open_in_flight));
      }
      ++snap.half_open_in_flight;
      trial = true;
    }
  }

  ProviderResult result;
  try {
    result = operation();
  } catch (const std::exception &ex) {
    result = ProviderResult::Failure(ErrorCode::kProviderError,
                                     "Backend call raised an exception",
                                     ex.what());
  } catch (...) {
    result = ProviderResult::Failure(ErrorCode::kProviderError,
                                     "Backend call raised an exception",
                                     "unknown exception type");
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  if (result.ok()) {
    RecordSuccessLocked(*entry, trial, Now());
  } else if (result.error.code == ErrorCode::kCancelled) {
    // A caller stop or cancellation says nothing about backend health.
    ReleaseTrialLocked(*entry, trial);
  } else {
    RecordFailureLocked(*entry, Now());
  }
  return result;
}

void CircuitBreaker::Reset(const std::string &backend_id) {
  auto entry = GetEntry(backend_id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  auto &snap = entry->snapshot;
  if (snap.state != CircuitState::kClosed) {
    TransitionLocked(*entry, CircuitState::kClosed, Now());
  }
  snap.consecutive_failures = 0;
}

void CircuitBreaker::ForceOpen(const std::string &backend_id) {
  auto entry = GetEntry(backend_id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  TransitionLocked(*entry, CircuitState::kOpen, Now());
}

CircuitStats CircuitBreaker::Stats() {
  CircuitStats stats;
  for (const auto &snap : Snapshots()) {
    switch (snap.state) {
    case CircuitState::kClosed:
      ++stats.closed;
      break;
    case CircuitState::kOpen:
      ++stats.open;
      break;
    case CircuitState::kHalfOpen:
      ++stats.half_open;
      break;
    }
  }
  return stats;
}

void CircuitBreaker::MaybeHalfOpenLocked(Entry &entry, Clock::time_point now) {
  auto &snap = entry.snapshot;
  if (snap.state != CircuitState::kOpen || !snap.open_since) {
    return;
  }
  if (now - *snap.open_since >= config_.recovery_timeout) {
    TransitionLocked(entry, CircuitState::kHalfOpen, now);
  }
}

void CircuitBreaker::TransitionLocked(Entry &entry, CircuitState to,
                                      Clock::time_point now) {
  auto &snap = entry.snapshot;
  CircuitState from = snap.state;
  snap.state = to;
  snap.half_open_in_flight = 0;
  snap.half_open_successes = 0;
  switch (to) {
  case CircuitState::kOpen:
    snap.open_since = now;
    break;
  case CircuitState::kClosed:
    snap.open_since.reset();
    snap.consecutive_failures = 0;
    break;
  case CircuitState::kHalfOpen:
    break;
  }
  if (from == to) {
    return;
  }
  GlobalMetrics().RecordCircuitTransition(snap.backend_id,
                                          CircuitStateName(to));
  auto detail = std::string(CircuitStateName(from)) + " -> " +
                CircuitStateName(to) + " consecutive_failures=" +
                std::to_string(snap.consecutive_failures);
  if (to == CircuitState::kOpen) {
    log::Warn("circuit_breaker", "circuit opened for " + snap.backend_id,
              detail);
  } else {
    log::Info("circuit_breaker", "circuit transition for " + snap.backend_id,
              detail);
  }
}

void CircuitBreaker::RecordSuccessLocked(Entry &entry, bool trial,
                                         Clock::time_point now) {
  auto &snap = entry.snapshot;
  ++snap.total_successes;
  snap.last_success = now;
  snap.consecutive_failures = 0;
  // Only trial calls admitted while half-open count toward closing; a call
  // admitted before the circuit opened says nothing about recovery.
  if (snap.state != CircuitState::kHalfOpen || !trial) {
    return;
  }
  ReleaseTrialLocked(entry, trial);
  ++snap.half_open_successes;
  if (snap.half_open_successes >= config_.half_open_max_calls) {
    TransitionLocked(entry, CircuitState::kClosed, now);
  }
}

void CircuitBreaker::ReleaseTrialLocked(Entry &entry, bool trial) {
  auto &snap = entry.snapshot;
  if (trial && snap.state == CircuitState::kHalfOpen &&
      snap.half_open_in_flight > 0) {
    --snap.half_open_in_flight;
  }
}

void CircuitBreaker::RecordFailureLocked(Entry &entry,
                                         Clock::time_point now) {
  auto &snap = entry.snapshot;
  ++snap.total_failures;
  ++snap.consecutive_failures;
  snap.last_failure = now;
  switch (snap.state) {
  case CircuitState::kHalfOpen:
    TransitionLocked(entry, CircuitState::kOpen, now);
    break;
  case CircuitState::kClosed:
    if (snap.consecutive_failures >= config_.failure_threshold) {
      TransitionLocked(entry, CircuitState::kOpen, now);
    }
    break;
  case CircuitState::kOpen:
    // Late result of a call admitted before the circuit opened.
    break;
  }
}

} // namespace switchyard
