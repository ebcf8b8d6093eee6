#include <catch2/catch_all.hpp>

#include "scheduler/admission_queue.h"

#include <chrono>
#include <thread>
#include <vector>

using namespace switchyard;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
  AdmissionQueue::Clock::time_point now{AdmissionQueue::Clock::now()};
  AdmissionQueue::ClockFn Fn() {
    return [this] { return now; };
  }
};

InferenceRequest Req(const std::string &id) {
  InferenceRequest request;
  request.request_id = id;
  request.caller_id = "agent";
  return request;
}

std::string Pop(AdmissionQueue &queue) {
  std::shared_ptr<QueuedRequest> item;
  auto status = queue.Dequeue(0ms, &item);
  REQUIRE(status == DequeueStatus::kDelivered);
  return item->request.request_id;
}

} // namespace

TEST_CASE("AdmissionQueue orders by priority then deadline then arrival",
          "[admission_queue]") {
  FakeClock clock;
  AdmissionQueue queue({}, clock.Fn());

  REQUIRE(queue.Enqueue(Req("low"), 2).ok());
  REQUIRE(queue.Enqueue(Req("normal-no-deadline"), 1).ok());
  REQUIRE(queue.Enqueue(Req("normal-late"), 1, clock.now + 10s).ok());
  REQUIRE(queue.Enqueue(Req("normal-early"), 1, clock.now + 5s).ok());
  REQUIRE(queue.Enqueue(Req("urgent"), 0).ok());
  clock.now += 1ms;
  REQUIRE(queue.Enqueue(Req("normal-no-deadline-2"), 1).ok());

  std::vector<std::string> order;
  while (queue.Size() > 0) {
    order.push_back(Pop(queue));
  }
  REQUIRE(order == std::vector<std::string>{
                       "urgent", "normal-early", "normal-late",
                       "normal-no-deadline", "normal-no-deadline-2", "low"});
}

TEST_CASE("AdmissionQueue breaks full ties by insertion sequence",
          "[admission_queue]") {
  FakeClock clock;
  AdmissionQueue queue({}, clock.Fn());
  REQUIRE(queue.Enqueue(Req("a"), 1).ok());
  REQUIRE(queue.Enqueue(Req("b"), 1).ok());
  REQUIRE(queue.Enqueue(Req("c"), 1).ok());
  REQUIRE(Pop(queue) == "a");
  REQUIRE(Pop(queue) == "b");
  REQUIRE(Pop(queue) == "c");
}

TEST_CASE("AdmissionQueue rejects when full", "[admission_queue]") {
  QueueConfig config;
  config.capacity = 2;
  AdmissionQueue queue(config);
  REQUIRE(queue.Enqueue(Req("a"), 0).ok());
  REQUIRE(queue.Enqueue(Req("b"), 0).ok());
  REQUIRE(queue.Full());
  auto error = queue.Enqueue(Req("c"), 0);
  REQUIRE(error.code == ErrorCode::kQueueFull);
  auto stats = queue.Stats();
  REQUIRE(stats.enqueued == 2);
  REQUIRE(stats.rejected == 1);
  REQUIRE(stats.depth == 2);
  REQUIRE(queue.Capacity() == 2);
}

TEST_CASE("AdmissionQueue default capacity", "[admission_queue]") {
  AdmissionQueue queue;
  REQUIRE(queue.Capacity() == 1000);
}

TEST_CASE("AdmissionQueue drops expired items through the handler",
          "[admission_queue]") {
  FakeClock clock;
  AdmissionQueue queue({}, clock.Fn());
  std::vector<std::string> expired;
  queue.SetExpiryHandler([&](const QueuedRequest &item) {
    expired.push_back(item.request.request_id);
  });

  REQUIRE(queue.EnqueueFor(Req("stale"), 0, 50ms).ok());
  REQUIRE(queue.Enqueue(Req("fresh"), 1).ok());
  clock.now += 100ms;

  std::shared_ptr<QueuedRequest> item;
  REQUIRE(queue.Dequeue(0ms, &item) == DequeueStatus::kExpired);
  REQUIRE(item == nullptr);
  REQUIRE(expired == std::vector<std::string>{"stale"});
  REQUIRE(queue.Dequeue(0ms, &item) == DequeueStatus::kDelivered);
  REQUIRE(item->request.request_id == "fresh");

  auto stats = queue.Stats();
  REQUIRE(stats.expired == 1);
  REQUIRE(stats.dequeued == 1);
}

TEST_CASE("AdmissionQueue uses the earlier of request and queue deadline",
          "[admission_queue]") {
  FakeClock clock;
  AdmissionQueue queue({}, clock.Fn());
  auto request = Req("r");
  request.deadline = clock.now + 1s;
  REQUIRE(queue.Enqueue(request, 0, clock.now + 10s).ok());
  std::shared_ptr<QueuedRequest> item;
  REQUIRE(queue.Dequeue(0ms, &item) == DequeueStatus::kDelivered);
  REQUIRE(item->deadline.has_value());
  REQUIRE(*item->deadline == clock.now + 1s);
}

TEST_CASE("AdmissionQueue Dequeue times out when empty", "[admission_queue]") {
  AdmissionQueue queue;
  std::shared_ptr<QueuedRequest> item;
  REQUIRE(queue.Dequeue(10ms, &item) == DequeueStatus::kTimedOut);
}

TEST_CASE("AdmissionQueue Close wakes waiters and drains", "[admission_queue]") {
  AdmissionQueue queue;
  REQUIRE(queue.Enqueue(Req("left-over"), 0).ok());
  queue.Close();
  REQUIRE(queue.Closed());
  REQUIRE(queue.Enqueue(Req("late"), 0).code == ErrorCode::kCancelled);

  std::shared_ptr<QueuedRequest> item;
  REQUIRE(queue.Dequeue(0ms, &item) == DequeueStatus::kDelivered);
  REQUIRE(queue.Dequeue(1s, &item) == DequeueStatus::kClosed);
}

TEST_CASE("AdmissionQueue blocked consumer receives a late item",
          "[admission_queue]") {
  AdmissionQueue queue;
  bool enqueued = false;
  std::thread producer([&] {
    std::this_thread::sleep_for(20ms);
    enqueued = queue.Enqueue(Req("late"), 0).ok();
  });
  std::shared_ptr<QueuedRequest> item;
  auto status = queue.Dequeue(5s, &item);
  producer.join();
  REQUIRE(enqueued);
  REQUIRE(status == DequeueStatus::kDelivered);
  REQUIRE(item->request.request_id == "late");
}
