#pragma once

#include "scheduler/admission_queue.h"
#include "scheduler/orchestrator.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace switchyard {

struct DispatcherConfig {
  QueueConfig queue;
  std::size_t workers{4};
  // How long an idle worker waits on the queue before re-checking for stop.
  std::chrono::milliseconds poll_interval{100};
};

// Dispatcher runs requests on a fixed worker pool fed by an AdmissionQueue.
// Submit never blocks: a full or stopped queue yields a ready future that
// carries the rejection, and requests whose deadline passes while queued
// resolve with kDeadlineExceeded without reaching a backend.
class Dispatcher {
public:
  explicit Dispatcher(std::shared_ptr<Orchestrator> orchestrator,
                      DispatcherConfig config = {});
  ~Dispatcher();

  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;

  // `timeout` bounds the total time from submission; the earlier of it and
  // the request's own deadline wins.
  std::future<GatewayResult>
  Submit(InferenceRequest request, int priority = 0,
         std::optional<std::chrono::milliseconds> timeout = std::nullopt,
         std::optional<RoutingStrategy> strategy = std::nullopt);

  // Closes the queue, lets the workers drain what is already queued, then
  // joins them. Idempotent.
  void Stop();

  GatewayHealth CheckHealth();
  QueueStats QueueStatistics() const { return queue_.Stats(); }
  std::size_t Workers() const { return config_.workers; }

private:
  void WorkerLoop();
  void Run(QueuedRequest &item);

  std::shared_ptr<Orchestrator> orchestrator_;
  DispatcherConfig config_;
  AdmissionQueue queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool> stopped_{false};
};

} // namespace switchyard
