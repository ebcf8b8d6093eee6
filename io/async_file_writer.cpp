#include "io/async_file_writer.h"

#include "server/logging/logger.h"

#include <fstream>
#include <system_error>

namespace switchyard {

AsyncFileWriter::AsyncFileWriter(std::size_t max_queue_depth)
    : max_queue_depth_(max_queue_depth == 0 ? 1 : max_queue_depth) {}

AsyncFileWriter::~AsyncFileWriter() { Stop(); }

void AsyncFileWriter::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopping_ = false;
  StartLocked();
}

void AsyncFileWriter::StartLocked() {
  if (!worker_.joinable()) {
    worker_ = std::thread(&AsyncFileWriter::Run, this);
  }
}

void AsyncFileWriter::Stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    worker = std::move(worker_);
  }
  work_cv_.notify_all();
  space_cv_.notify_all();
  if (worker.joinable()) {
    worker.join();
  }
  idle_cv_.notify_all();
}

bool AsyncFileWriter::Enqueue(AsyncWriteTask task) {
  std::unique_lock<std::mutex> lock(mutex_);
  space_cv_.wait(lock, [&] {
    return stopping_ || pending_.size() < max_queue_depth_;
  });
  if (stopping_) {
    return false;
  }
  pending_.push_back(std::move(task));
  StartLocked();
  work_cv_.notify_one();
  return true;
}

void AsyncFileWriter::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [&] {
    return (pending_.empty() && !busy_) || !worker_.joinable();
  });
}

std::size_t AsyncFileWriter::failed_writes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_writes_;
}

void AsyncFileWriter::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    work_cv_.wait(lock, [&] { return stopping_ || !pending_.empty(); });
    if (pending_.empty()) {
      return;  // stopping and drained
    }
    AsyncWriteTask task = std::move(pending_.front());
    pending_.pop_front();
    busy_ = true;
    space_cv_.notify_one();

    lock.unlock();
    bool ok = Apply(task);
    lock.lock();

    busy_ = false;
    if (!ok) {
      ++failed_writes_;
    }
    if (pending_.empty()) {
      idle_cv_.notify_all();
    }
  }
}

bool AsyncFileWriter::Apply(const AsyncWriteTask& task) {
  std::error_code ec;
  if (task.op == AsyncFileOp::kRemove) {
    std::filesystem::remove(task.path, ec);
    if (ec) {
      log::Warn("async_file_writer", "remove failed",
                "path=" + task.path.string() + " error=" + ec.message());
      return false;
    }
    return true;
  }

  auto staging = task.path;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    out.write(task.contents.data(),
              static_cast<std::streamsize>(task.contents.size()));
    if (!out) {
      log::Warn("async_file_writer", "write failed",
                "path=" + staging.string());
      return false;
    }
  }
  std::filesystem::rename(staging, task.path, ec);
  if (ec) {
    log::Warn("async_file_writer", "rename failed",
              "path=" + task.path.string() + " error=" + ec.message());
    std::filesystem::remove(staging, ec);
    return false;
  }
  return true;
}

}  // namespace switchyard
