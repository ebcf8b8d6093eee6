#include "scheduler/admission_queue.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

namespace switchyard {

bool AdmissionQueue::Order::operator()(
    const std::shared_ptr<QueuedRequest> &a,
    const std::shared_ptr<QueuedRequest> &b) const {
  if (a->priority != b->priority) {
    return a->priority < b->priority;
  }
  if (a->deadline.has_value() != b->deadline.has_value()) {
    return a->deadline.has_value();
  }
  if (a->deadline && *a->deadline != *b->deadline) {
    return *a->deadline < *b->deadline;
  }
  if (a->enqueue_time != b->enqueue_time) {
    return a->enqueue_time < b->enqueue_time;
  }
  return a->sequence < b->sequence;
}

AdmissionQueue::AdmissionQueue(QueueConfig config, ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
  if (config_.capacity == 0) {
    config_.capacity = 1;
  }
}

GatewayError
AdmissionQueue::Enqueue(InferenceRequest request, int priority,
                        std::optional<Clock::time_point> deadline,
                        std::shared_ptr<std::promise<GatewayResult>> promise,
                        std::optional<RoutingStrategy> strategy) {
  auto item = std::make_shared<QueuedRequest>();
  item->priority = priority < 0 ? 0 : priority;
  item->deadline = deadline;
  if (request.deadline &&
      (!item->deadline || *request.deadline < *item->deadline)) {
    item->deadline = request.deadline;
  }
  item->request = std::move(request);
  item->promise = std::move(promise);
  item->strategy = strategy;

  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return GatewayError(ErrorCode::kCancelled, "admission queue is closed");
    }
    if (items_.size() >= config_.capacity) {
      ++stats_.rejected;
      GlobalMetrics().RecordQueueEvent("rejected");
      return GatewayError(ErrorCode::kQueueFull, "admission queue is full",
                          "capacity=" + std::to_string(config_.capacity));
    }
    item->enqueue_time = Now();
    item->sequence = next_sequence_++;
    items_.insert(item);
    ++stats_.enqueued;
    depth = items_.size();
  }
  GlobalMetrics().RecordQueueEvent("enqueued");
  GlobalMetrics().SetQueueDepth(static_cast<int>(depth));
  cv_.notify_one();
  return {};
}

GatewayError AdmissionQueue::EnqueueFor(
    InferenceRequest request, int priority, std::chrono::milliseconds timeout,
    std::shared_ptr<std::promise<GatewayResult>> promise) {
  return Enqueue(std::move(request), priority, Now() + timeout,
                 std::move(promise));
}

DequeueStatus AdmissionQueue::Dequeue(std::chrono::milliseconds timeout,
                                      std::shared_ptr<QueuedRequest> *out) {
  std::shared_ptr<QueuedRequest> item;
  ExpiryHandler on_expired;
  std::size_t depth = 0;
  bool expired = false;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout,
                      [&] { return closed_ || !items_.empty(); })) {
      return DequeueStatus::kTimedOut;
    }
    if (items_.empty()) {
      return DequeueStatus::kClosed;
    }
    item = *items_.begin();
    items_.erase(items_.begin());
    depth = items_.size();
    if (item->deadline && Now() >= *item->deadline) {
      expired = true;
      ++stats_.expired;
      on_expired = on_expired_;
    } else {
      ++stats_.dequeued;
    }
  }
  GlobalMetrics().SetQueueDepth(static_cast<int>(depth));

  if (expired) {
    GlobalMetrics().RecordQueueEvent("expired");
    log::Debug("admission_queue", "Dropped expired request",
               "request_id=" + item->request.request_id);
    if (on_expired) {
      on_expired(*item);
    }
    return DequeueStatus::kExpired;
  }

  GlobalMetrics().RecordQueueEvent("dequeued");
  GlobalMetrics().RecordQueueLatency(
      std::chrono::duration<double, std::milli>(Now() - item->enqueue_time)
          .count());
  if (out) {
    *out = std::move(item);
  }
  return DequeueStatus::kDelivered;
}

void AdmissionQueue::SetExpiryHandler(ExpiryHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_expired_ = std::move(handler);
}

void AdmissionQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool AdmissionQueue::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t AdmissionQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

bool AdmissionQueue::Full() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size() >= config_.capacity;
}

QueueStats AdmissionQueue::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto stats = stats_;
  stats.depth = items_.size();
  return stats;
}

} // namespace switchyard
