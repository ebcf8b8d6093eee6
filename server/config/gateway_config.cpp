#include "server/config/gateway_config.h"

#include "runtime/response_cache/file_cache_store.h"
#include "runtime/response_cache/hashing_embedder.h"
#include "runtime/response_cache/memory_cache_store.h"
#include "runtime/response_cache/ollama_embedder.h"
#include "scheduler/catalog_loader.h"
#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace switchyard {

namespace {

template <typename T>
void ReadScalar(const YAML::Node &node, const char *key, T &out) {
  if (node && node[key]) {
    out = node[key].as<T>();
  }
}

void ReadMillis(const YAML::Node &node, const char *key,
                std::chrono::milliseconds &out) {
  if (node && node[key]) {
    out = std::chrono::milliseconds(node[key].as<int64_t>());
  }
}

bool Fail(std::string &error, const std::string &message) {
  error = message;
  return false;
}

bool ParseLogging(const YAML::Node &node, LoggingConfig &out,
                  std::string &error) {
  ReadScalar(node, "format", out.format);
  ReadScalar(node, "level", out.level);
  if (out.format != "text" && out.format != "json") {
    return Fail(error, "logging.format must be text or json");
  }
  if (!log::ParseLevel(out.level)) {
    return Fail(error, "logging.level '" + out.level + "' is unknown");
  }
  return true;
}

bool ParseRouting(const YAML::Node &node, GatewayConfig &out,
                  std::string &error) {
  if (!node) {
    return true;
  }
  if (node["default_strategy"]) {
    auto name = node["default_strategy"].as<std::string>();
    auto strategy = ParseRoutingStrategy(name);
    if (!strategy) {
      return Fail(error, "routing.default_strategy '" + name + "' is unknown");
    }
    out.routing.default_strategy = *strategy;
  }
  ReadScalar(node, "max_fallbacks", out.routing.max_fallbacks);
  if (node["rate_limit_scope"]) {
    auto name = node["rate_limit_scope"].as<std::string>();
    auto scope = ParseRateLimitScope(name);
    if (!scope) {
      return Fail(error, "routing.rate_limit_scope '" + name + "' is unknown");
    }
    out.orchestrator.rate_limit_scope = *scope;
  }
  return true;
}

bool ParseCircuitBreaker(const YAML::Node &node, CircuitBreakerConfig &out,
                         std::string &error) {
  ReadScalar(node, "failure_threshold", out.failure_threshold);
  ReadMillis(node, "recovery_timeout_ms", out.recovery_timeout);
  ReadScalar(node, "half_open_max_calls", out.half_open_max_calls);
  if (out.failure_threshold < 1) {
    return Fail(error, "circuit_breaker.failure_threshold must be >= 1");
  }
  if (out.recovery_timeout.count() < 0) {
    return Fail(error, "circuit_breaker.recovery_timeout_ms must be >= 0");
  }
  if (out.half_open_max_calls < 1) {
    return Fail(error, "circuit_breaker.half_open_max_calls must be >= 1");
  }
  return true;
}

bool ParseCache(const YAML::Node &node, GatewayConfig &out,
                std::string &error) {
  if (!node) {
    return true;
  }
  ReadScalar(node, "enabled", out.cache.enabled);
  if (node["ttl_seconds"]) {
    auto ttl = node["ttl_seconds"].as<int64_t>();
    if (ttl <= 0) {
      return Fail(error, "cache.ttl_seconds must be > 0");
    }
    out.cache.ttl = std::chrono::seconds(ttl);
  }
  if (const auto similarity = node["similarity"]) {
    ReadScalar(similarity, "enabled", out.cache.similarity_enabled);
    ReadScalar(similarity, "threshold", out.cache.similarity_threshold);
    ReadScalar(similarity, "max_scan", out.cache.max_similarity_scan);
    if (out.cache.similarity_threshold <= 0.0 ||
        out.cache.similarity_threshold > 1.0) {
      return Fail(error, "cache.similarity.threshold must be in (0, 1]");
    }
  }
  if (const auto store = node["store"]) {
    ReadScalar(store, "type", out.cache_store.type);
    ReadScalar(store, "directory", out.cache_store.directory);
    ReadScalar(store, "capacity", out.cache_store.capacity);
    if (out.cache_store.type != "memory" && out.cache_store.type != "file") {
      return Fail(error, "cache.store.type must be memory or file");
    }
    if (out.cache_store.capacity == 0) {
      return Fail(error, "cache.store.capacity must be > 0");
    }
  }
  if (const auto embedder = node["embedder"]) {
    ReadScalar(embedder, "type", out.embedder.type);
    ReadScalar(embedder, "dimensions", out.embedder.dimensions);
    ReadScalar(embedder, "url", out.embedder.url);
    ReadScalar(embedder, "model", out.embedder.model);
    ReadScalar(embedder, "timeout_ms", out.embedder.timeout_ms);
    if (out.embedder.type != "hashing" && out.embedder.type != "ollama") {
      return Fail(error, "cache.embedder.type must be hashing or ollama");
    }
    if (out.embedder.dimensions == 0) {
      return Fail(error, "cache.embedder.dimensions must be > 0");
    }
  }
  return true;
}

bool ParseQueue(const YAML::Node &node, DispatcherConfig &out,
                std::string &error) {
  ReadScalar(node, "capacity", out.queue.capacity);
  ReadScalar(node, "workers", out.workers);
  ReadMillis(node, "poll_interval_ms", out.poll_interval);
  if (out.queue.capacity == 0) {
    return Fail(error, "queue.capacity must be > 0");
  }
  if (out.workers == 0) {
    return Fail(error, "queue.workers must be > 0");
  }
  if (out.poll_interval.count() <= 0) {
    return Fail(error, "queue.poll_interval_ms must be > 0");
  }
  return true;
}

void OverrideInt(const char *name, int &out) {
  const char *value = std::getenv(name);
  if (!value) {
    return;
  }
  try {
    out = std::stoi(value);
  } catch (const std::exception &) {
    log::Warn("config", "ignoring non-numeric environment override",
              std::string(name) + "=" + value);
  }
}

std::shared_ptr<Embedder> BuildEmbedder(const EmbedderConfig &config) {
  if (config.type == "hashing") {
    return std::make_shared<HashingEmbedder>(config.dimensions);
  }
  if (config.type == "ollama") {
    return std::make_shared<OllamaEmbedder>(config.url, config.model,
                                            config.timeout_ms);
  }
  throw std::invalid_argument("unknown embedder type '" + config.type + "'");
}

std::shared_ptr<CacheStore> BuildCacheStore(const CacheStoreConfig &config) {
  if (config.type == "memory") {
    return std::make_shared<MemoryCacheStore>(config.capacity);
  }
  if (config.type == "file") {
    if (config.directory.empty()) {
      throw std::invalid_argument("file cache store requires a directory");
    }
    return std::make_shared<FileCacheStore>(config.directory, config.capacity);
  }
  throw std::invalid_argument("unknown cache store type '" + config.type +
                              "'");
}

} // namespace

bool ParseGatewayConfig(const std::string &text, GatewayConfig &out,
                        std::string &error) {
  GatewayConfig config;
  try {
    YAML::Node root = YAML::Load(text);
    if (root.IsNull()) {
      out = std::move(config);
      return true;
    }
    if (!root.IsMap()) {
      return Fail(error, "config root is not a mapping");
    }
    if (!ParseLogging(root["logging"], config.logging, error) ||
        !ParseRouting(root["routing"], config, error) ||
        !ParseCircuitBreaker(root["circuit_breaker"], config.circuit_breaker,
                             error)) {
      return false;
    }
    if (const auto limits = root["rate_limits"]) {
      ReadScalar(limits, "enabled", config.rate_limits_enabled);
      ReadScalar(limits, "requests_per_minute",
                 config.rate_limits.requests_per_minute);
      ReadScalar(limits, "units_per_minute",
                 config.rate_limits.units_per_minute);
    }
    if (!ParseCache(root["cache"], config, error) ||
        !ParseQueue(root["queue"], config.dispatcher, error)) {
      return false;
    }
    ReadScalar(root["usage"], "path", config.usage_path);
    config.backends = ParseBackendList(root["backends"]);
  } catch (const YAML::Exception &ex) {
    return Fail(error, ex.what());
  }
  out = std::move(config);
  return true;
}

bool LoadGatewayConfig(const std::string &path, GatewayConfig &out,
                       std::string &error) {
  std::ifstream in(path);
  if (!in) {
    return Fail(error, "cannot open config file " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (!ParseGatewayConfig(buffer.str(), out, error)) {
    error = path + ": " + error;
    return false;
  }
  ApplyEnvOverrides(out);
  log::Info("config", "loaded gateway config",
            "path=" + path + " backends=" + std::to_string(out.backends.size()));
  return true;
}

void ApplyEnvOverrides(GatewayConfig &config) {
  if (const char *format = std::getenv("SWITCHYARD_LOG_FORMAT")) {
    config.logging.format = format;
  }
  if (const char *level = std::getenv("SWITCHYARD_LOG_LEVEL")) {
    config.logging.level = level;
  }
  if (const char *dir = std::getenv("SWITCHYARD_CACHE_DIR")) {
    config.cache_store.type = "file";
    config.cache_store.directory = dir;
  }
  OverrideInt("SWITCHYARD_RATE_LIMIT_RPM",
              config.rate_limits.requests_per_minute);
  OverrideInt("SWITCHYARD_RATE_LIMIT_UPM", config.rate_limits.units_per_minute);
}

void ApplyLoggingConfig(const LoggingConfig &config) {
  log::SetJsonMode(config.format == "json");
  if (auto level = log::ParseLevel(config.level)) {
    log::SetMinLevel(*level);
  } else {
    log::Warn("config", "unknown log level, keeping current",
              "level=" + config.level);
  }
}

std::unique_ptr<Dispatcher>
Gateway::StartDispatcher(const DispatcherConfig &config) {
  return std::make_unique<Dispatcher>(orchestrator, config);
}

Gateway BuildGateway(const GatewayConfig &config) {
  Gateway gateway;
  gateway.catalog = std::make_shared<BackendCatalog>();
  int registered = LoadCatalog(*gateway.catalog, config.backends);

  gateway.breaker = std::make_shared<CircuitBreaker>(config.circuit_breaker);
  gateway.router = std::make_shared<BackendRouter>(
      gateway.catalog, gateway.breaker, config.routing);
  if (config.rate_limits_enabled) {
    gateway.rate_limiter = std::make_shared<RateLimiter>(config.rate_limits);
  }
  if (config.cache.enabled) {
    std::shared_ptr<Embedder> embedder;
    if (config.cache.similarity_enabled) {
      embedder = BuildEmbedder(config.embedder);
    }
    gateway.cache = std::make_shared<ResponseCache>(
        config.cache, BuildCacheStore(config.cache_store), embedder);
  }
  if (!config.usage_path.empty()) {
    gateway.usage = std::make_shared<UsageLogger>(config.usage_path);
    if (!gateway.usage->Enabled()) {
      log::Warn("config", "usage log could not be opened; usage not recorded",
                "path=" + config.usage_path);
      gateway.usage.reset();
    }
  }

  Orchestrator::Dependencies deps;
  deps.catalog = gateway.catalog;
  deps.breaker = gateway.breaker;
  deps.router = gateway.router;
  deps.rate_limiter = gateway.rate_limiter;
  deps.cache = gateway.cache;
  deps.usage = gateway.usage;
  gateway.orchestrator =
      std::make_shared<Orchestrator>(std::move(deps), config.orchestrator);

  log::Info("config", "gateway built",
            "backends=" + std::to_string(registered) +
                " cache=" + (gateway.cache ? config.cache_store.type : "off") +
                " rate_limits=" + (gateway.rate_limiter ? "on" : "off") +
                " scope=" +
                RateLimitScopeName(config.orchestrator.rate_limit_scope));
  return gateway;
}

} // namespace switchyard
