#pragma once

#include "scheduler/request_types.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

namespace switchyard {

struct QueueConfig {
  std::size_t capacity{1000};
};

struct QueuedRequest {
  using TimePoint = std::chrono::steady_clock::time_point;

  InferenceRequest request;
  int priority{0}; // 0 = most urgent
  TimePoint enqueue_time;
  std::optional<TimePoint> deadline;
  uint64_t sequence{0};
  std::optional<RoutingStrategy> strategy;
  // Set when the submitter waits on a future; resolved by whoever consumes
  // or expires the item.
  std::shared_ptr<std::promise<GatewayResult>> promise;
};

struct QueueStats {
  uint64_t enqueued{0};
  uint64_t dequeued{0};
  uint64_t expired{0};
  uint64_t rejected{0};
  std::size_t depth{0};
};

enum class DequeueStatus { kDelivered, kTimedOut, kExpired, kClosed };

// Bounded priority queue in front of the orchestrator. Items are ordered by
// priority tier, then deadline (items without one last), then enqueue time,
// then insertion sequence. Enqueue never blocks.
class AdmissionQueue {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;
  using ExpiryHandler = std::function<void(const QueuedRequest &)>;

  explicit AdmissionQueue(QueueConfig config = {}, ClockFn clock = {});

  // kQueueFull at capacity, kCancelled once closed. The effective deadline is
  // the earlier of `deadline` and the request's own deadline.
  GatewayError
  Enqueue(InferenceRequest request, int priority,
          std::optional<Clock::time_point> deadline = std::nullopt,
          std::shared_ptr<std::promise<GatewayResult>> promise = nullptr,
          std::optional<RoutingStrategy> strategy = std::nullopt);
  GatewayError
  EnqueueFor(InferenceRequest request, int priority,
             std::chrono::milliseconds timeout,
             std::shared_ptr<std::promise<GatewayResult>> promise = nullptr);

  // Waits up to `timeout` for the head item. An item whose deadline passed is
  // dropped and handed to the expiry handler; the call then returns kExpired
  // so the caller re-polls. Remaining items are still delivered after
  // Close(); kClosed is returned once the queue is closed and empty.
  DequeueStatus Dequeue(std::chrono::milliseconds timeout,
                        std::shared_ptr<QueuedRequest> *out);

  void SetExpiryHandler(ExpiryHandler handler);
  void Close();
  bool Closed() const;

  std::size_t Size() const;
  std::size_t Capacity() const { return config_.capacity; }
  bool Full() const;
  QueueStats Stats() const;

private:
  struct Order {
    bool operator()(const std::shared_ptr<QueuedRequest> &a,
                    const std::shared_ptr<QueuedRequest> &b) const;
  };

  Clock::time_point Now() const { return clock_ ? clock_() : Clock::now(); }

  QueueConfig config_;
  ClockFn clock_;
  ExpiryHandler on_expired_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::set<std::shared_ptr<QueuedRequest>, Order> items_;
  bool closed_{false};
  uint64_t next_sequence_{0};
  QueueStats stats_;
};

} // namespace switchyard
