#include "runtime/response_cache/response_cache.h"
#include "scheduler/backend_router.h"
#include "server/config/gateway_config.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace switchyard;

namespace {

std::filesystem::path SwitchyardHome() {
  if (const char *env = std::getenv("SWITCHYARD_HOME")) {
    return std::filesystem::path(env);
  }
  if (const char *home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".switchyard";
  }
  return std::filesystem::current_path() / ".switchyard";
}

std::filesystem::path DefaultConfigPath() {
  return SwitchyardHome() / "config.yaml";
}

std::vector<std::string> SplitCsv(const std::string &raw) {
  std::vector<std::string> out;
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

void PrintUsage() {
  std::cout
      << "Usage: switchyard-ctl [--config FILE] <command> [options]\n"
      << "Commands:\n"
      << "  catalog  [--capability NAME] [--provider NAME]\n"
      << "           List configured backends.\n"
      << "  route    [--capability NAME]... [--strategy NAME]\n"
      << "           [--max-latency MS] [--max-cost USD] [--region NAME]...\n"
      << "           [--provider NAME]... [--exclude ID]... [--stream]\n"
      << "           [--input-tokens N] [--max-output N] [--min-context N]\n"
      << "           Dry-run routing and print the decision.\n"
      << "  check    Validate the config and build every component.\n"
      << "  cache invalidate [--backend ID] [--older-than SECONDS]\n"
      << "           Remove cached responses from the configured store.\n"
      << "Config defaults to $SWITCHYARD_HOME/config.yaml "
         "(~/.switchyard/config.yaml).\n";
}

json BackendToJson(const BackendDescriptor &backend) {
  json j;
  j["id"] = backend.id;
  j["provider"] = backend.provider;
  j["display_name"] = backend.display_name;
  j["status"] = BackendStatusName(backend.status);
  j["capabilities"] = backend.capabilities.features;
  j["context_window"] = backend.context_window;
  j["max_output_tokens"] = backend.max_output_tokens;
  j["cost"] = {{"input", backend.input_cost_per_million},
               {"output", backend.output_cost_per_million},
               {"cached", backend.cached_cost_per_million}};
  j["latency"] = {{"p50_ms", backend.latency_p50_ms},
                  {"p99_ms", backend.latency_p99_ms}};
  j["regions"] = backend.regions;
  j["quality"] = backend.quality_scores;
  j["provisioned_throughput"] = backend.provisioned_throughput;
  return j;
}

json DecisionToJson(const RoutingDecision &decision) {
  return {{"primary_backend_id", decision.primary_backend_id},
          {"primary_provider", decision.primary_provider},
          {"fallback_backend_ids", decision.fallback_backend_ids},
          {"strategy", RoutingStrategyName(decision.strategy)},
          {"estimated_cost", decision.estimated_cost},
          {"estimated_latency_ms", decision.estimated_latency_ms},
          {"estimated_input_tokens", decision.estimated_input_tokens},
          {"candidate_count", decision.candidate_count},
          {"reason", decision.reason}};
}

int CmdCatalog(const Gateway &gateway, int argc, char **argv, int start) {
  std::string capability;
  std::string provider;
  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--capability" && i + 1 < argc) {
      capability = argv[++i];
    } else if (arg == "--provider" && i + 1 < argc) {
      provider = argv[++i];
    }
  }
  std::vector<BackendDescriptor> backends;
  if (!capability.empty()) {
    backends = gateway.catalog->ListByCapabilities({capability});
  } else if (!provider.empty()) {
    backends = gateway.catalog->ListByProvider(provider);
  } else {
    backends = gateway.catalog->List();
  }
  json out = json::array();
  for (const auto &backend : backends) {
    if (!provider.empty() && backend.provider != provider) {
      continue;
    }
    out.push_back(BackendToJson(backend));
  }
  std::cout << out.dump(2) << std::endl;
  return 0;
}

int CmdRoute(const Gateway &gateway, int argc, char **argv, int start) {
  InferenceRequest request;
  request.request_id = "switchyard-ctl";
  request.caller_id = "switchyard-ctl";
  std::optional<RoutingStrategy> strategy;
  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--capability" && i + 1 < argc) {
      for (auto &cap : SplitCsv(argv[++i])) {
        request.requirements.capabilities.push_back(cap);
      }
    } else if (arg == "--strategy" && i + 1 < argc) {
      std::string name = argv[++i];
      strategy = ParseRoutingStrategy(name);
      if (!strategy) {
        std::cerr << "unknown strategy '" << name << "'" << std::endl;
        return 1;
      }
    } else if (arg == "--max-latency" && i + 1 < argc) {
      request.constraints.max_latency_ms = std::stoi(argv[++i]);
    } else if (arg == "--max-cost" && i + 1 < argc) {
      request.constraints.max_cost = std::stod(argv[++i]);
    } else if (arg == "--region" && i + 1 < argc) {
      for (auto &region : SplitCsv(argv[++i])) {
        request.constraints.allowed_regions.push_back(region);
      }
    } else if (arg == "--provider" && i + 1 < argc) {
      for (auto &provider : SplitCsv(argv[++i])) {
        request.constraints.preferred_providers.push_back(provider);
      }
    } else if (arg == "--exclude" && i + 1 < argc) {
      for (auto &id : SplitCsv(argv[++i])) {
        request.constraints.excluded_backends.push_back(id);
      }
    } else if (arg == "--stream") {
      request.constraints.streaming_required = true;
    } else if (arg == "--input-tokens" && i + 1 < argc) {
      request.estimated_input_tokens = std::stoi(argv[++i]);
    } else if (arg == "--max-output" && i + 1 < argc) {
      request.prompt.params.max_output_tokens = std::stoi(argv[++i]);
    } else if (arg == "--min-context" && i + 1 < argc) {
      request.requirements.min_context_tokens = std::stoi(argv[++i]);
    }
  }

  auto result = gateway.router->Route(request, strategy);
  if (!result.ok()) {
    json err = {{"error", ErrorCodeName(result.error.code)},
                {"message", result.error.message},
                {"detail", result.error.detail}};
    std::cout << err.dump(2) << std::endl;
    return 2;
  }
  std::cout << DecisionToJson(*result.decision).dump(2) << std::endl;
  return 0;
}

int CmdCheck(const GatewayConfig &config, const Gateway &gateway) {
  auto stats = gateway.catalog->Stats();
  json out;
  out["backends"] = {{"configured", config.backends.size()},
                     {"registered", stats.total},
                     {"active", stats.active},
                     {"by_provider", stats.by_provider}};
  out["routing"] = {
      {"default_strategy",
       RoutingStrategyName(config.routing.default_strategy)},
      {"max_fallbacks", config.routing.max_fallbacks},
      {"rate_limit_scope",
       RateLimitScopeName(config.orchestrator.rate_limit_scope)}};
  out["cache"] = {{"enabled", gateway.cache != nullptr},
                  {"store", config.cache_store.type},
                  {"similarity",
                   gateway.cache && gateway.cache->similarity_enabled()}};
  out["rate_limits"] = {{"enabled", gateway.rate_limiter != nullptr},
                        {"requests_per_minute",
                         config.rate_limits.requests_per_minute},
                        {"units_per_minute",
                         config.rate_limits.units_per_minute}};
  out["queue"] = {{"capacity", config.dispatcher.queue.capacity},
                  {"workers", config.dispatcher.workers}};
  out["usage_log"] = config.usage_path;
  std::cout << out.dump(2) << std::endl;
  if (stats.total == 0) {
    std::cerr << "no backends registered" << std::endl;
    return 1;
  }
  return 0;
}

int CmdCache(const Gateway &gateway, int argc, char **argv, int start) {
  if (start >= argc || std::string(argv[start]) != "invalidate") {
    PrintUsage();
    return 1;
  }
  if (!gateway.cache) {
    std::cerr << "cache is disabled in this config" << std::endl;
    return 1;
  }
  CacheInvalidation filter;
  for (int i = start + 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--backend" && i + 1 < argc) {
      filter.backend_id = argv[++i];
    } else if (arg == "--older-than" && i + 1 < argc) {
      filter.older_than = std::chrono::seconds(std::stoll(argv[++i]));
    }
  }
  auto removed = gateway.cache->Invalidate(filter);
  std::cout << json{{"removed", removed}}.dump() << std::endl;
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  log::ConfigureFromEnv();

  std::string config_path;
  int index = 1;
  while (index < argc) {
    std::string arg = argv[index];
    if (arg == "--config" && index + 1 < argc) {
      config_path = argv[index + 1];
      index += 2;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    } else {
      break;
    }
  }
  if (index >= argc) {
    PrintUsage();
    return 1;
  }
  std::string command = argv[index++];
  if (config_path.empty()) {
    config_path = DefaultConfigPath().string();
  }

  GatewayConfig config;
  std::string error;
  if (!LoadGatewayConfig(config_path, config, error)) {
    std::cerr << "Error loading config: " << error << std::endl;
    return 1;
  }
  ApplyLoggingConfig(config.logging);

  try {
    auto gateway = BuildGateway(config);
    if (command == "catalog") {
      return CmdCatalog(gateway, argc, argv, index);
    }
    if (command == "route") {
      return CmdRoute(gateway, argc, argv, index);
    }
    if (command == "check") {
      return CmdCheck(config, gateway);
    }
    if (command == "cache") {
      return CmdCache(gateway, argc, argv, index);
    }
    PrintUsage();
    return 1;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
}
