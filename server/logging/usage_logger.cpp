#include "server/logging/usage_logger.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <chrono>

using json = nlohmann::json;

namespace switchyard {

UsageLogger::UsageLogger(const std::string& path) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
    if (!stream_.is_open()) {
      log::Warn("usage_logger", "cannot open usage log", path);
    }
  }
}

void UsageLogger::Record(const UsageRecord& record) {
  if (!Enabled()) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
  json j;
  j["timestamp"] = ts;
  j["request_id"] = record.request_id;
  j["caller_id"] = record.caller_id;
  j["backend_id"] = record.backend_id;
  j["provider"] = record.provider;
  j["input_tokens"] = record.input_tokens;
  j["output_tokens"] = record.output_tokens;
  j["cached_tokens"] = record.cached_tokens;
  j["latency_ms"] = record.latency_ms;
  j["cached"] = record.cached;
  j["cost_estimate"] = record.cost_estimate;
  j["status"] = record.status;
  j["attempts"] = record.attempts;
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << j.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
  stream_.flush();
}

}  // namespace switchyard
