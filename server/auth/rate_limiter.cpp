#include "server/auth/rate_limiter.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>
#include <exception>

namespace switchyard {

namespace {

void Refill(TokenBucket& bucket, int limit, RateLimiter::Clock::time_point now) {
  double capacity = limit > 0 ? static_cast<double>(limit) : 0.0;
  if (bucket.capacity != capacity) {
    bucket.capacity = capacity;
    bucket.level = std::min(bucket.level, capacity);
  }
  auto elapsed =
      std::chrono::duration_cast<std::chrono::duration<double>>(now - bucket.last_refill)
          .count();
  if (elapsed > 0) {
    bucket.level = std::min(capacity, bucket.level + elapsed / 60.0 * capacity);
  }
  bucket.last_refill = now;
}

void Prepare(BucketState& state, const RateLimits& limits,
             RateLimiter::Clock::time_point now) {
  if (!state.initialized) {
    state.initialized = true;
    state.requests = {static_cast<double>(std::max(limits.requests_per_minute, 0)),
                      static_cast<double>(std::max(limits.requests_per_minute, 0)), now};
    state.units = {static_cast<double>(std::max(limits.units_per_minute, 0)),
                   static_cast<double>(std::max(limits.units_per_minute, 0)), now};
    return;
  }
  Refill(state.requests, limits.requests_per_minute, now);
  Refill(state.units, limits.units_per_minute, now);
}

BucketUsage ToUsage(const TokenBucket& bucket) {
  return {bucket.level, bucket.capacity, bucket.capacity - bucket.level};
}

}  // namespace

LocalBucketStore::LocalBucketStore(std::chrono::seconds idle_ttl, ClockFn clock)
    : idle_ttl_(idle_ttl), clock_(std::move(clock)), last_sweep_(Now()) {}

std::shared_ptr<LocalBucketStore::Slot> LocalBucketStore::FindOrInsert(
    const std::string& key) {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it != slots_.end()) {
      return it->second;
    }
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto now = Now();
  if (now - last_sweep_ >= idle_ttl_) {
    SweepLocked(now);
  }
  auto& entry = slots_[key];
  if (!entry) {
    entry = std::make_shared<Slot>();
    entry->last_used = now;
  }
  return entry;
}

void LocalBucketStore::SweepLocked(Clock::time_point now) {
  last_sweep_ = now;
  std::size_t evicted = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    auto& slot = *it->second;
    // A busy slot is in use right now and therefore not idle.
    std::unique_lock<std::mutex> slot_lock(slot.mutex, std::try_to_lock);
    if (slot_lock.owns_lock() && now - slot.last_used >= idle_ttl_) {
      slot.evicted = true;
      it = slots_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  if (evicted > 0) {
    log::Debug("rate_limiter", "evicted idle buckets",
               "evicted=" + std::to_string(evicted) +
                   " remaining=" + std::to_string(slots_.size()));
  }
}

void LocalBucketStore::Update(const std::string& key,
                              const std::function<void(BucketState&)>& fn) {
  // A slot evicted between lookup and lock is retried against the map.
  for (;;) {
    auto slot = FindOrInsert(key);
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->evicted) {
      continue;
    }
    slot->last_used = Now();
    fn(slot->state);
    return;
  }
}

void LocalBucketStore::Erase(const std::string& key) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  slots_.erase(key);
}

void LocalBucketStore::Clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  slots_.clear();
}

std::size_t LocalBucketStore::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return slots_.size();
}

RateLimiter::RateLimiter(RateLimits limits, std::shared_ptr<BucketStore> store,
                         ClockFn clock)
    : store_(store ? std::move(store) : std::make_shared<LocalBucketStore>()),
      clock_(std::move(clock)),
      limits_(limits) {}

std::string RateLimiter::BucketKey(const std::string& caller,
                                   const std::string& backend) {
  return "ratelimit:" + caller + ":" + backend;
}

RateLimits RateLimiter::Effective(const std::optional<RateLimits>& overrides) const {
  if (overrides) {
    return *overrides;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return limits_;
}

GatewayError RateLimiter::Check(const std::string& caller,
                                const std::string& backend, int units,
                                const std::optional<RateLimits>& overrides) {
  auto limits = Effective(overrides);
  if (limits.requests_per_minute <= 0 && limits.units_per_minute <= 0) {
    return {};
  }
  double wanted_units = static_cast<double>(std::max(units, 0));
  auto now = Now();
  GatewayError result;
  try {
    store_->Update(BucketKey(caller, backend), [&](BucketState& state) {
      Prepare(state, limits, now);
      if (limits.requests_per_minute > 0 && state.requests.level < 1.0) {
        result = {ErrorCode::kRequestRateExceeded, "Request rate limit exceeded",
                  "caller=" + caller + " backend=" + backend +
                      " limit=" + std::to_string(limits.requests_per_minute) + "/min"};
        return;
      }
      if (limits.units_per_minute > 0 && state.units.level < wanted_units) {
        result = {ErrorCode::kUnitRateExceeded, "Unit rate limit exceeded",
                  "caller=" + caller + " backend=" + backend +
                      " requested=" + std::to_string(units) +
                      " limit=" + std::to_string(limits.units_per_minute) + "/min"};
        return;
      }
      if (limits.requests_per_minute > 0) {
        state.requests.level -= 1.0;
      }
      if (limits.units_per_minute > 0) {
        state.units.level -= wanted_units;
      }
    });
  } catch (const std::exception& ex) {
    GlobalMetrics().RecordRateLimitFailOpen();
    log::Warn("rate_limiter", "bucket store error; allowing request",
              std::string("caller=") + caller + " error=" + ex.what());
    return {};
  }
  if (!result.ok()) {
    GlobalMetrics().RecordRateLimitRejection(
        result.code == ErrorCode::kRequestRateExceeded ? "requests" : "units");
  }
  return result;
}

RateLimitUsage RateLimiter::Usage(const std::string& caller,
                                  const std::string& backend,
                                  const std::optional<RateLimits>& overrides) {
  auto limits = Effective(overrides);
  auto now = Now();
  RateLimitUsage usage;
  try {
    store_->Update(BucketKey(caller, backend), [&](BucketState& state) {
      Prepare(state, limits, now);
      usage.requests = ToUsage(state.requests);
      usage.units = ToUsage(state.units);
    });
  } catch (const std::exception& ex) {
    log::Warn("rate_limiter", "bucket store error while reading usage",
              std::string("caller=") + caller + " error=" + ex.what());
  }
  return usage;
}

void RateLimiter::Reset(const std::string& caller, const std::string& backend) {
  try {
    store_->Erase(BucketKey(caller, backend));
  } catch (const std::exception& ex) {
    log::Warn("rate_limiter", "bucket store error during reset",
              std::string("caller=") + caller + " error=" + ex.what());
  }
}

void RateLimiter::UpdateLimits(const RateLimits& limits) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    limits_ = limits;
  }
  try {
    store_->Clear();
  } catch (const std::exception& ex) {
    log::Warn("rate_limiter", "bucket store error during clear", ex.what());
  }
}

bool RateLimiter::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return limits_.requests_per_minute > 0 || limits_.units_per_minute > 0;
}

RateLimits RateLimiter::CurrentLimits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return limits_;
}

}  // namespace switchyard
