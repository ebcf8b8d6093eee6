#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace switchyard {

enum class AsyncFileOp { kWrite, kRemove };

struct AsyncWriteTask {
  AsyncFileOp op{AsyncFileOp::kWrite};
  std::filesystem::path path;
  std::string contents;  // ignored for kRemove
};

// Write-behind file writer with one background thread, so tasks apply in
// enqueue order (a write followed by a remove of the same path never
// resurrects the file). Writes land in "<path>.tmp" and are renamed over the
// target. Producers block while max_queue_depth tasks are pending.
class AsyncFileWriter {
 public:
  explicit AsyncFileWriter(std::size_t max_queue_depth = 256);
  ~AsyncFileWriter();

  AsyncFileWriter(const AsyncFileWriter&) = delete;
  AsyncFileWriter& operator=(const AsyncFileWriter&) = delete;

  // Starts the worker. Enqueue starts it on first use; Start also re-opens a
  // stopped writer.
  void Start();
  // Applies everything already queued, then joins the worker.
  void Stop();
  // Returns false once the writer is stopped.
  bool Enqueue(AsyncWriteTask task);
  // Blocks until every task enqueued so far has been applied.
  void Flush();

  std::size_t failed_writes() const;

 private:
  void StartLocked();
  void Run();
  bool Apply(const AsyncWriteTask& task);

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable space_cv_;
  std::condition_variable idle_cv_;
  std::deque<AsyncWriteTask> pending_;
  std::thread worker_;
  std::size_t max_queue_depth_;
  std::size_t failed_writes_{0};
  bool busy_{false};
  bool stopping_{false};
};

}  // namespace switchyard
