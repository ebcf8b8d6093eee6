#pragma once

#include "runtime/response_cache/response_cache.h"
#include "scheduler/backend_catalog.h"
#include "scheduler/backend_router.h"
#include "scheduler/circuit_breaker.h"
#include "scheduler/dispatcher.h"
#include "scheduler/orchestrator.h"
#include "server/auth/rate_limiter.h"
#include "server/logging/usage_logger.h"

#include <memory>
#include <string>
#include <vector>

namespace switchyard {

// Gateway configuration file. Every section and key is optional; omitted
// values keep the defaults of the corresponding component config.
//
//   logging:
//     format: text            # text | json
//     level: info             # debug | info | warn | error
//   routing:
//     default_strategy: capability_first
//     max_fallbacks: 2
//     rate_limit_scope: gateway   # gateway | backend
//   circuit_breaker:
//     failure_threshold: 5
//     recovery_timeout_ms: 60000
//     half_open_max_calls: 3
//   rate_limits:
//     enabled: true
//     requests_per_minute: 60
//     units_per_minute: 100000
//   cache:
//     enabled: true
//     ttl_seconds: 3600
//     similarity: {enabled: false, threshold: 0.95, max_scan: 1024}
//     store: {type: memory, directory: /var/cache/switchyard, capacity: 10000}
//     embedder: {type: hashing, dimensions: 256}
//               # or {type: ollama, url: http://localhost:11434,
//               #     model: nomic-embed-text, timeout_ms: 10000}
//   queue:
//     capacity: 1000
//     workers: 4
//     poll_interval_ms: 100
//   usage:
//     path: /var/log/switchyard/usage.jsonl
//   backends:
//     - ...                   # see scheduler/catalog_loader.h

struct LoggingConfig {
  std::string format{"text"};
  std::string level{"info"};
};

struct CacheStoreConfig {
  std::string type{"memory"}; // memory | file
  std::string directory;
  std::size_t capacity{10000};
};

struct EmbedderConfig {
  std::string type{"hashing"}; // hashing | ollama
  std::size_t dimensions{256};
  std::string url{"http://localhost:11434"};
  std::string model{"nomic-embed-text"};
  int timeout_ms{10000};
};

struct GatewayConfig {
  LoggingConfig logging;
  RouterConfig routing;
  OrchestratorConfig orchestrator;
  CircuitBreakerConfig circuit_breaker;
  bool rate_limits_enabled{true};
  RateLimits rate_limits;
  ResponseCacheConfig cache;
  CacheStoreConfig cache_store;
  EmbedderConfig embedder;
  DispatcherConfig dispatcher;
  std::string usage_path;
  std::vector<BackendDescriptor> backends;
};

// Parses YAML text into `out`. Returns false with a message in `error` on
// malformed YAML, a wrong value type or an out-of-range value. Invalid
// backend entries are logged and skipped rather than failing the parse.
bool ParseGatewayConfig(const std::string &text, GatewayConfig &out,
                        std::string &error);

// Reads and parses a config file, then applies the environment overrides.
bool LoadGatewayConfig(const std::string &path, GatewayConfig &out,
                       std::string &error);

// SWITCHYARD_LOG_FORMAT, SWITCHYARD_LOG_LEVEL, SWITCHYARD_CACHE_DIR (also
// selects the file store), SWITCHYARD_RATE_LIMIT_RPM and
// SWITCHYARD_RATE_LIMIT_UPM. Unparseable numbers are logged and ignored.
void ApplyEnvOverrides(GatewayConfig &config);

// Applies the logging section to the process-wide logger.
void ApplyLoggingConfig(const LoggingConfig &config);

// The wired components of a gateway. Adapters are registered by the
// embedding application; the dispatcher is created on demand because it
// starts worker threads.
struct Gateway {
  std::shared_ptr<BackendCatalog> catalog;
  std::shared_ptr<CircuitBreaker> breaker;
  std::shared_ptr<BackendRouter> router;
  std::shared_ptr<RateLimiter> rate_limiter;
  std::shared_ptr<ResponseCache> cache;
  std::shared_ptr<UsageLogger> usage;
  std::shared_ptr<Orchestrator> orchestrator;

  std::unique_ptr<Dispatcher> StartDispatcher(const DispatcherConfig &config);
};

// Builds every component from `config`. Throws std::invalid_argument for an
// unknown cache store or embedder type, or a file store without a directory.
Gateway BuildGateway(const GatewayConfig &config);

} // namespace switchyard
