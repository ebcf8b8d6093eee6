#include "scheduler/catalog_loader.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>

namespace switchyard {

namespace {

template <typename T>
void ReadScalar(const YAML::Node &node, const char *key, T &out) {
  if (node[key]) {
    out = node[key].as<T>();
  }
}

std::vector<std::string> ReadStringList(const YAML::Node &node) {
  std::vector<std::string> out;
  if (!node) {
    return out;
  }
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
    return out;
  }
  for (const auto &item : node) {
    out.push_back(item.as<std::string>());
  }
  return out;
}

bool SameDescriptor(const BackendDescriptor &a, const BackendDescriptor &b) {
  return a.id == b.id && a.provider == b.provider &&
         a.display_name == b.display_name &&
         a.capabilities.features == b.capabilities.features &&
         a.context_window == b.context_window &&
         a.max_output_tokens == b.max_output_tokens &&
         a.input_cost_per_million == b.input_cost_per_million &&
         a.output_cost_per_million == b.output_cost_per_million &&
         a.cached_cost_per_million == b.cached_cost_per_million &&
         a.requests_per_minute == b.requests_per_minute &&
         a.units_per_minute == b.units_per_minute &&
         a.latency_p50_ms == b.latency_p50_ms &&
         a.latency_p99_ms == b.latency_p99_ms && a.status == b.status &&
         a.regions == b.regions && a.quality_scores == b.quality_scores &&
         a.provisioned_throughput == b.provisioned_throughput;
}

} // namespace

bool ParseBackendNode(const YAML::Node &node, BackendDescriptor &out,
                      std::string &error) {
  if (!node.IsMap()) {
    error = "backend entry is not a mapping";
    return false;
  }
  try {
    ReadScalar(node, "id", out.id);
    ReadScalar(node, "provider", out.provider);
    ReadScalar(node, "display_name", out.display_name);
    for (const auto &capability : ReadStringList(node["capabilities"])) {
      auto normalized = NormalizeCapability(capability);
      if (!normalized.empty()) {
        out.capabilities.features.insert(normalized);
      }
    }
    ReadScalar(node, "context_window", out.context_window);
    ReadScalar(node, "max_output_tokens", out.max_output_tokens);
    if (const auto cost = node["cost"]) {
      ReadScalar(cost, "input", out.input_cost_per_million);
      ReadScalar(cost, "output", out.output_cost_per_million);
      ReadScalar(cost, "cached", out.cached_cost_per_million);
    }
    if (const auto limits = node["rate_limits"]) {
      ReadScalar(limits, "requests_per_minute", out.requests_per_minute);
      ReadScalar(limits, "units_per_minute", out.units_per_minute);
    }
    if (const auto latency = node["latency"]) {
      ReadScalar(latency, "p50_ms", out.latency_p50_ms);
      ReadScalar(latency, "p99_ms", out.latency_p99_ms);
    }
    if (node["status"]) {
      auto status = ParseBackendStatus(node["status"].as<std::string>());
      if (!status) {
        error = "unknown status '" + node["status"].as<std::string>() + "'";
        return false;
      }
      out.status = *status;
    }
    out.regions = ReadStringList(node["regions"]);
    if (const auto quality = node["quality"]) {
      for (const auto &entry : quality) {
        out.quality_scores[NormalizeCapability(
            entry.first.as<std::string>())] = entry.second.as<double>();
      }
    }
    ReadScalar(node, "provisioned_throughput", out.provisioned_throughput);
  } catch (const YAML::Exception &ex) {
    error = ex.what();
    return false;
  }
  return true;
}

std::vector<BackendDescriptor> ParseBackendList(const YAML::Node &backends) {
  std::vector<BackendDescriptor> out;
  if (!backends || backends.IsNull()) {
    return out;
  }
  if (!backends.IsSequence()) {
    log::Warn("catalog", "'backends' is not a sequence; nothing to load");
    return out;
  }
  std::size_t index = 0;
  for (const auto &node : backends) {
    BackendDescriptor descriptor;
    std::string error;
    if (!ParseBackendNode(node, descriptor, error)) {
      log::Warn("catalog", "skipping backend entry",
                "index=" + std::to_string(index) + " error=" + error);
    } else {
      auto validation = ValidateBackendDescriptor(descriptor);
      if (!validation.ok()) {
        log::Warn("catalog", "skipping backend entry",
                  "index=" + std::to_string(index) + " error=" +
                      validation.ToString());
      } else {
        out.push_back(std::move(descriptor));
      }
    }
    ++index;
  }
  return out;
}

int LoadCatalog(BackendCatalog &catalog,
                const std::vector<BackendDescriptor> &descriptors) {
  int registered = 0;
  for (const auto &descriptor : descriptors) {
    auto error = catalog.Register(descriptor);
    if (!error.ok()) {
      log::Warn("catalog", "backend rejected", error.ToString());
      continue;
    }
    ++registered;
  }
  return registered;
}

CatalogWatcher::CatalogWatcher(std::shared_ptr<BackendCatalog> catalog)
    : catalog_(std::move(catalog)) {}

CatalogWatcher::~CatalogWatcher() { Stop(); }

int CatalogWatcher::LoadAndWatch(const std::filesystem::path &path,
                                 int poll_interval_ms) {
  if (running_.load())
    return 0; // already watching

  path_ = path;
  poll_interval_ms_ = poll_interval_ms;

  std::error_code ec;
  last_mtime_ = std::filesystem::last_write_time(path_, ec);
  int loaded = Reload();

  running_.store(true);
  watch_thread_ = std::thread([this] { WatchLoop(); });

  return loaded;
}

int CatalogWatcher::LoadOnce(const std::filesystem::path &path) {
  path_ = path;
  return Reload();
}

void CatalogWatcher::Stop() {
  if (!running_.load())
    return;
  running_.store(false);
  if (watch_thread_.joinable()) {
    watch_thread_.join();
  }
}

std::set<std::string> CatalogWatcher::ManagedIds() const {
  std::lock_guard<std::mutex> lock(managed_mutex_);
  std::set<std::string> ids;
  for (const auto &[id, descriptor] : managed_) {
    ids.insert(id);
  }
  return ids;
}

int CatalogWatcher::Reload() {
  if (!std::filesystem::exists(path_)) {
    log::Warn("catalog", "catalog file not found: " + path_.string());
    return 0;
  }

  std::ifstream f(path_);
  if (!f.is_open()) {
    log::Error("catalog", "cannot open catalog file: " + path_.string());
    return 0;
  }
  std::ostringstream buf;
  buf << f.rdbuf();

  YAML::Node root;
  try {
    root = YAML::Load(buf.str());
  } catch (const YAML::Exception &ex) {
    // Keep the current catalog when the edited file is broken.
    log::Error("catalog", std::string("YAML parse error: ") + ex.what());
    return 0;
  }
  return ApplyEntries(ParseBackendList(root["backends"]));
}

int CatalogWatcher::ApplyEntries(
    const std::vector<BackendDescriptor> &entries) {
  std::map<std::string, BackendDescriptor> desired;
  for (const auto &e : entries) {
    desired[e.id] = e;
  }

  std::lock_guard<std::mutex> lock(managed_mutex_);
  int net = 0;

  std::vector<std::string> to_remove;
  for (const auto &[id, applied] : managed_) {
    auto it = desired.find(id);
    if (it == desired.end() || !SameDescriptor(it->second, applied)) {
      to_remove.push_back(id);
    }
  }
  for (const auto &id : to_remove) {
    auto error = catalog_->Unregister(id);
    if (!error.ok()) {
      log::Warn("catalog", "failed to unregister backend id=" + id,
                error.ToString());
    } else if (!desired.count(id)) {
      --net;
    }
    managed_.erase(id);
  }

  for (const auto &[id, entry] : desired) {
    if (managed_.count(id))
      continue; // unchanged

    bool replacing = std::find(to_remove.begin(), to_remove.end(), id) !=
                     to_remove.end();
    auto error = catalog_->Register(entry);
    if (!error.ok()) {
      log::Error("catalog", "failed to register backend id=" + id,
                 error.ToString());
      if (replacing) {
        --net;
      }
      continue;
    }
    managed_[id] = entry;
    if (!replacing) {
      ++net;
    }
  }

  return net;
}

void CatalogWatcher::WatchLoop() {
  while (running_.load()) {
    // Sleep in short intervals so Stop() is responsive.
    for (int i = 0; i < poll_interval_ms_ / 100 && running_.load(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!running_.load())
      break;

    try {
      auto mtime = std::filesystem::last_write_time(path_);
      if (mtime != last_mtime_) {
        last_mtime_ = mtime;
        log::Info("catalog",
                  "catalog file changed; reloading: " + path_.string());
        Reload();
      }
    } catch (const std::filesystem::filesystem_error &ex) {
      log::Warn("catalog",
                std::string("cannot stat catalog file: ") + ex.what());
    }
  }
}

} // namespace switchyard
