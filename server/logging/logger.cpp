#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace switchyard {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_mutex;
std::ostream *g_out = nullptr; // guarded by g_mutex

const char *LevelString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetMinLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

std::optional<Level> ParseLevel(const std::string &name) {
  auto lowered = Lower(name);
  if (lowered == "debug") {
    return Level::DEBUG;
  }
  if (lowered == "info") {
    return Level::INFO;
  }
  if (lowered == "warn" || lowered == "warning") {
    return Level::WARN;
  }
  if (lowered == "error") {
    return Level::ERROR;
  }
  return std::nullopt;
}

void ConfigureFromEnv() {
  if (const char *format = std::getenv("SWITCHYARD_LOG_FORMAT")) {
    SetJsonMode(Lower(format) == "json");
  }
  if (const char *level = std::getenv("SWITCHYARD_LOG_LEVEL")) {
    if (auto parsed = ParseLevel(level)) {
      SetMinLevel(*parsed);
    }
  }
}

void SetOutput(std::ostream *out) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_out = out;
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelString(level);
    j["component"] = component;
    j["message"] = message;
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    // Invalid UTF-8 in provider text must not abort logging.
    line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  } else {
    line = std::string("[") + LevelString(level) + "] " + component + ": " +
           message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  std::ostream &out = g_out ? *g_out : std::cerr;
  out << line << "\n";
}

} // namespace log
} // namespace switchyard
