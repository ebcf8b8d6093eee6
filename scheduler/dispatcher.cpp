#include "scheduler/dispatcher.h"

#include "server/logging/logger.h"

#include <stdexcept>

namespace switchyard {

namespace {

std::future<GatewayResult> Ready(GatewayError error) {
  std::promise<GatewayResult> promise;
  GatewayResult result;
  result.error = std::move(error);
  promise.set_value(std::move(result));
  return promise.get_future();
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<Orchestrator> orchestrator,
                       DispatcherConfig config)
    : orchestrator_(std::move(orchestrator)), config_(config),
      queue_(config.queue) {
  if (!orchestrator_) {
    throw std::invalid_argument("Dispatcher requires an orchestrator");
  }
  if (config_.workers == 0) {
    config_.workers = 1;
  }
  queue_.SetExpiryHandler([](const QueuedRequest &item) {
    if (!item.promise) {
      return;
    }
    GatewayResult result;
    result.error = GatewayError(ErrorCode::kDeadlineExceeded,
                                "request expired while queued",
                                "request_id=" + item.request.request_id);
    item.promise->set_value(std::move(result));
  });
  for (std::size_t i = 0; i < config_.workers; ++i) {
    workers_.emplace_back(&Dispatcher::WorkerLoop, this);
  }
  log::Info("dispatcher", "Started worker pool",
            "workers=" + std::to_string(config_.workers) +
                " capacity=" + std::to_string(queue_.Capacity()));
}

Dispatcher::~Dispatcher() { Stop(); }

std::future<GatewayResult>
Dispatcher::Submit(InferenceRequest request, int priority,
                   std::optional<std::chrono::milliseconds> timeout,
                   std::optional<RoutingStrategy> strategy) {
  if (stopped_.load()) {
    return Ready(GatewayError(ErrorCode::kCancelled, "dispatcher is stopped"));
  }
  if (timeout) {
    auto deadline = std::chrono::steady_clock::now() + *timeout;
    if (!request.deadline || deadline < *request.deadline) {
      request.deadline = deadline;
    }
  }
  auto promise = std::make_shared<std::promise<GatewayResult>>();
  auto future = promise->get_future();
  auto deadline = request.deadline;
  auto error = queue_.Enqueue(std::move(request), priority, deadline, promise,
                              strategy);
  if (!error.ok()) {
    return Ready(std::move(error));
  }
  return future;
}

void Dispatcher::WorkerLoop() {
  while (true) {
    std::shared_ptr<QueuedRequest> item;
    auto status = queue_.Dequeue(config_.poll_interval, &item);
    if (status == DequeueStatus::kClosed) {
      return;
    }
    if (status == DequeueStatus::kDelivered && item) {
      Run(*item);
    }
  }
}

void Dispatcher::Run(QueuedRequest &item) {
  try {
    auto result = orchestrator_->Execute(item.request, item.strategy);
    if (item.promise) {
      item.promise->set_value(std::move(result));
    }
  } catch (const std::exception &ex) {
    log::Error("dispatcher", "Request failed with an exception",
               "request_id=" + item.request.request_id + " " + ex.what());
    if (item.promise) {
      item.promise->set_exception(std::current_exception());
    }
  } catch (...) {
    log::Error("dispatcher", "Request failed with an unknown exception",
               "request_id=" + item.request.request_id);
    if (item.promise) {
      item.promise->set_exception(std::current_exception());
    }
  }
}

void Dispatcher::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  queue_.Close();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  log::Info("dispatcher", "Stopped worker pool");
}

GatewayHealth Dispatcher::CheckHealth() {
  auto health = orchestrator_->CheckHealth();
  health.queue = queue_.Stats();
  return health;
}

} // namespace switchyard
