#pragma once

#include "scheduler/backend_catalog.h"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace switchyard {

// ── Catalog YAML ────────────────────────────────────────────────────────────
//
//   backends:
//     - id: claude-sonnet
//       provider: anthropic
//       display_name: Claude Sonnet
//       capabilities: [text, vision, tool_use, streaming]
//       context_window: 200000
//       max_output_tokens: 8192
//       cost: {input: 3.0, output: 15.0, cached: 0.3}   # USD per million
//       rate_limits: {requests_per_minute: 50, units_per_minute: 40000}
//       latency: {p50_ms: 800, p99_ms: 3000}
//       status: active
//       regions: [us-east-1]
//       quality: {reasoning: 0.92, coding: 0.9}
//       provisioned_throughput: false

// Parses one entry of the `backends` sequence. Returns false with a message
// in `error` when a field has the wrong type or an unknown status.
bool ParseBackendNode(const YAML::Node &node, BackendDescriptor &out,
                      std::string &error);

// Parses every entry of a `backends` sequence node. Invalid entries are
// logged and skipped. A missing or null node yields an empty list.
std::vector<BackendDescriptor> ParseBackendList(const YAML::Node &backends);

// Registers descriptors into the catalog; entries rejected by the catalog
// are logged and skipped. Returns the count registered.
int LoadCatalog(BackendCatalog &catalog,
                const std::vector<BackendDescriptor> &descriptors);

// ── CatalogWatcher ──────────────────────────────────────────────────────────
// Loads a catalog YAML file into a BackendCatalog and hot-reloads it when the
// file changes on disk. Backends removed from the file are unregistered,
// new ones registered and edited ones replaced.
//
// Lifecycle:
//   CatalogWatcher watcher(catalog);
//   watcher.LoadAndWatch("/etc/switchyard/backends.yaml", /*poll_ms=*/5000);
//   // ... gateway runs ...
//   watcher.Stop();   // (or let destructor call it)
//
// Thread safety: all public methods are thread-safe.
class CatalogWatcher {
public:
  explicit CatalogWatcher(std::shared_ptr<BackendCatalog> catalog);
  ~CatalogWatcher();

  // Parse the file and start a background polling thread. Returns the net
  // count of backends registered by the initial read. A second call is a
  // no-op (returns 0).
  int LoadAndWatch(const std::filesystem::path &path,
                   int poll_interval_ms = 5000);

  // Force an immediate re-read and diff against the current state. Returns
  // the net change (+ for registrations, - for removals).
  int Reload();

  // Reload() against an explicit path without starting the watcher.
  int LoadOnce(const std::filesystem::path &path);

  void Stop();

  bool IsWatching() const { return running_.load(); }

  // Backend ids currently owned by this watcher.
  std::set<std::string> ManagedIds() const;

private:
  void WatchLoop();
  int ApplyEntries(const std::vector<BackendDescriptor> &entries);

  std::shared_ptr<BackendCatalog> catalog_;
  std::filesystem::path path_;
  int poll_interval_ms_{5000};

  std::atomic<bool> running_{false};
  std::thread watch_thread_;

  std::filesystem::file_time_type last_mtime_{};

  mutable std::mutex managed_mutex_;
  // id -> last applied descriptor (for change detection on reload)
  std::map<std::string, BackendDescriptor> managed_;
};

} // namespace switchyard
