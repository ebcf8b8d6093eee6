#pragma once

#include "scheduler/gateway_error.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace switchyard {

// Per-minute limits. A limit <= 0 disables that bucket.
struct RateLimits {
  int requests_per_minute{60};
  int units_per_minute{100000};
};

struct TokenBucket {
  double capacity{0.0};
  double level{0.0};
  std::chrono::steady_clock::time_point last_refill;
};

// Both buckets of one (caller, backend) pair.
struct BucketState {
  bool initialized{false};
  TokenBucket requests;
  TokenBucket units;
};

// BucketStore holds bucket state, possibly outside the process. Update runs
// `fn` atomically with respect to other updates of the same key. Store
// failures are reported by throwing a std::exception; the limiter then
// fails open.
class BucketStore {
 public:
  virtual ~BucketStore() = default;

  virtual void Update(const std::string& key,
                      const std::function<void(BucketState&)>& fn) = 0;
  virtual void Erase(const std::string& key) = 0;
  virtual void Clear() = 0;
};

// In-process store with one mutex per key. A slot untouched for `idle_ttl`
// holds a full bucket anyway, so it is dropped by a sweep that runs on
// insert at most once per `idle_ttl`.
class LocalBucketStore : public BucketStore {
 public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  explicit LocalBucketStore(
      std::chrono::seconds idle_ttl = std::chrono::minutes(2),
      ClockFn clock = {});

  void Update(const std::string& key,
              const std::function<void(BucketState&)>& fn) override;
  void Erase(const std::string& key) override;
  void Clear() override;

  std::size_t size() const;

 private:
  struct Slot {
    std::mutex mutex;
    BucketState state;            // guarded by mutex
    Clock::time_point last_used;  // guarded by mutex
    bool evicted{false};          // guarded by mutex
  };

  Clock::time_point Now() const { return clock_ ? clock_() : Clock::now(); }
  std::shared_ptr<Slot> FindOrInsert(const std::string& key);
  // Requires mutex_ held exclusively.
  void SweepLocked(Clock::time_point now);

  std::chrono::seconds idle_ttl_;
  ClockFn clock_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
  Clock::time_point last_sweep_;
};

struct BucketUsage {
  double available{0.0};
  double capacity{0.0};
  double used{0.0};
};

struct RateLimitUsage {
  BucketUsage requests;
  BucketUsage units;
};

// RateLimiter enforces a request-count and a unit-count token bucket per
// (caller, backend). Buckets start full and refill continuously at
// capacity per minute. A check is all-or-nothing: a rejected request leaves
// both buckets untouched.
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  explicit RateLimiter(RateLimits limits = {},
                       std::shared_ptr<BucketStore> store = nullptr,
                       ClockFn clock = {});

  // Returns kOk when allowed, kRequestRateExceeded or kUnitRateExceeded when
  // a bucket is short. `overrides` replaces the default limits for this key
  // (e.g. a backend's own quota). Store errors are logged and allow the
  // request.
  GatewayError Check(const std::string& caller, const std::string& backend,
                     int units,
                     const std::optional<RateLimits>& overrides = std::nullopt);

  RateLimitUsage Usage(const std::string& caller, const std::string& backend,
                       const std::optional<RateLimits>& overrides =
                           std::nullopt);

  void Reset(const std::string& caller, const std::string& backend);

  // Replaces the default limits and clears all bucket state.
  void UpdateLimits(const RateLimits& limits);

  bool Enabled() const;
  RateLimits CurrentLimits() const;

  static std::string BucketKey(const std::string& caller,
                               const std::string& backend);

 private:
  Clock::time_point Now() const { return clock_ ? clock_() : Clock::now(); }
  RateLimits Effective(const std::optional<RateLimits>& overrides) const;

  std::shared_ptr<BucketStore> store_;
  ClockFn clock_;

  mutable std::mutex mutex_;
  RateLimits limits_;
};

}  // namespace switchyard
