#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace switchyard {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line).
// Default mode is plain text: "[LEVEL] component: message".
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below the minimum level are dropped. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();
std::optional<Level> ParseLevel(const std::string &name);

// Applies SWITCHYARD_LOG_FORMAT=json|text and SWITCHYARD_LOG_LEVEL from the
// environment. Call from main() before any logging.
void ConfigureFromEnv();

// Redirects output (default std::cerr). Pass nullptr to restore stderr.
// The stream must outlive every subsequent Log call.
void SetOutput(std::ostream *out);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "orchestrator", "router", "cache").  `extra` is an optional key=value
// string appended to the JSON object or the text line (ignored when empty).
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace switchyard
