#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace switchyard {

// One record per gateway call, whatever its outcome. Cost is estimated from
// the catalog price of the backend that produced the response.
struct UsageRecord {
  std::string request_id;
  std::string caller_id;
  std::string backend_id;
  std::string provider;
  int input_tokens{0};
  int output_tokens{0};
  int cached_tokens{0};
  int64_t latency_ms{0};
  bool cached{false};
  double cost_estimate{0.0};
  std::string status; // ResponseStatus name, or the ErrorCode name on failure
  int attempts{0};
};

// Destination for usage records (billing export, analytics). Implementations
// may throw; the orchestrator logs and drops such failures.
class UsageSink {
 public:
  virtual ~UsageSink() = default;
  virtual void Record(const UsageRecord& record) = 0;
};

// Appends one JSON object per line to a file.
class UsageLogger : public UsageSink {
 public:
  UsageLogger() = default;
  explicit UsageLogger(const std::string& path);

  bool Enabled() const { return stream_.is_open(); }
  void Record(const UsageRecord& record) override;

 private:
  std::ofstream stream_;
  std::mutex mutex_;
};

}  // namespace switchyard
