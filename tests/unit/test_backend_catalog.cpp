#include <catch2/catch_all.hpp>

#include "scheduler/backend_catalog.h"

#include <string>
#include <vector>

using namespace switchyard;

namespace {

BackendDescriptor MakeBackend(const std::string &id,
                              const std::string &provider,
                              std::set<std::string> capabilities) {
  BackendDescriptor d;
  d.id = id;
  d.provider = provider;
  d.capabilities.features = std::move(capabilities);
  d.context_window = 128000;
  d.max_output_tokens = 4096;
  d.input_cost_per_million = 3.0;
  d.output_cost_per_million = 15.0;
  return d;
}

std::vector<std::string> Ids(const std::vector<BackendDescriptor> &list) {
  std::vector<std::string> out;
  for (const auto &d : list) {
    out.push_back(d.id);
  }
  return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Registration and validation
// ---------------------------------------------------------------------------

TEST_CASE("BackendCatalog registers and retrieves a backend",
          "[backend_catalog]") {
  BackendCatalog catalog;
  REQUIRE(catalog.Register(MakeBackend("gpt-4o", "openai", {"text"})).ok());

  auto found = catalog.Get("gpt-4o");
  REQUIRE(found.has_value());
  REQUIRE(found->provider == "openai");
  REQUIRE(found->display_name == "gpt-4o");
  REQUIRE(catalog.Contains("gpt-4o"));
  REQUIRE(catalog.Size() == 1);
}

TEST_CASE("BackendCatalog rejects duplicate ids", "[backend_catalog]") {
  BackendCatalog catalog;
  REQUIRE(catalog.Register(MakeBackend("a", "openai", {"text"})).ok());
  auto error = catalog.Register(MakeBackend("a", "anthropic", {"text"}));
  REQUIRE(error.code == ErrorCode::kDuplicateBackend);
  REQUIRE(catalog.Get("a")->provider == "openai");
}

TEST_CASE("BackendCatalog validates descriptor invariants",
          "[backend_catalog]") {
  BackendCatalog catalog;

  auto no_id = MakeBackend("", "openai", {"text"});
  REQUIRE(catalog.Register(no_id).code == ErrorCode::kInvalidBackendConfig);

  auto no_provider = MakeBackend("x", "", {"text"});
  REQUIRE(catalog.Register(no_provider).code ==
          ErrorCode::kInvalidBackendConfig);

  auto zero_context = MakeBackend("x", "openai", {"text"});
  zero_context.context_window = 0;
  REQUIRE(catalog.Register(zero_context).code ==
          ErrorCode::kInvalidBackendConfig);

  auto zero_output = MakeBackend("x", "openai", {"text"});
  zero_output.max_output_tokens = 0;
  auto error = catalog.Register(zero_output);
  REQUIRE(error.code == ErrorCode::kInvalidBackendConfig);
  REQUIRE(error.category() == ErrorCategory::kConfiguration);

  REQUIRE(catalog.Size() == 0);
}

TEST_CASE("BackendCatalog GetOrFail reports unknown ids", "[backend_catalog]") {
  BackendCatalog catalog;
  BackendDescriptor out;
  REQUIRE(catalog.GetOrFail("missing", out).code ==
          ErrorCode::kBackendNotFound);
  REQUIRE_FALSE(catalog.Get("missing").has_value());
}

// ---------------------------------------------------------------------------
// Capability queries
// ---------------------------------------------------------------------------

TEST_CASE("BackendCatalog lists backends supporting every capability",
          "[backend_catalog]") {
  BackendCatalog catalog;
  REQUIRE(catalog.Register(MakeBackend("c", "openai", {"text", "vision"})).ok());
  REQUIRE(catalog.Register(MakeBackend("a", "anthropic",
                                       {"TEXT", "Vision", "tool_use"}))
              .ok());
  REQUIRE(catalog.Register(MakeBackend("b", "openai", {"text"})).ok());

  REQUIRE(Ids(catalog.ListByCapabilities({"vision"})) ==
          std::vector<std::string>{"a", "c"});
  REQUIRE(Ids(catalog.ListByCapabilities({"vision", "tool_use"})) ==
          std::vector<std::string>{"a"});
  REQUIRE(catalog.ListByCapabilities({"audio"}).empty());
}

TEST_CASE("BackendCatalog empty requirement returns all active backends",
          "[backend_catalog]") {
  BackendCatalog catalog;
  REQUIRE(catalog.Register(MakeBackend("b", "openai", {"text"})).ok());
  REQUIRE(catalog.Register(MakeBackend("a", "openai", {"text"})).ok());
  auto disabled = MakeBackend("z", "openai", {"text"});
  disabled.status = BackendStatus::kDisabled;
  REQUIRE(catalog.Register(disabled).ok());

  REQUIRE(Ids(catalog.ListByCapabilities({})) ==
          std::vector<std::string>{"a", "b"});
  REQUIRE(Ids(catalog.List()) == std::vector<std::string>{"a", "b", "z"});
  REQUIRE(Ids(catalog.List(BackendStatus::kDisabled)) ==
          std::vector<std::string>{"z"});
}

TEST_CASE("BackendCatalog status updates affect capability listings",
          "[backend_catalog]") {
  BackendCatalog catalog;
  REQUIRE(catalog.Register(MakeBackend("a", "openai", {"vision"})).ok());
  REQUIRE(catalog.UpdateStatus("a", BackendStatus::kDeprecated).ok());
  REQUIRE(catalog.ListByCapabilities({"vision"}).empty());
  REQUIRE(catalog.UpdateStatus("a", BackendStatus::kActive).ok());
  REQUIRE(catalog.ListByCapabilities({"vision"}).size() == 1);
  REQUIRE(catalog.UpdateStatus("nope", BackendStatus::kActive).code ==
          ErrorCode::kBackendNotFound);
}

TEST_CASE("BackendCatalog provider index and unregister",
          "[backend_catalog]") {
  BackendCatalog catalog;
  REQUIRE(catalog.Register(MakeBackend("a", "openai", {"text"})).ok());
  REQUIRE(catalog.Register(MakeBackend("b", "anthropic", {"text", "vision"}))
              .ok());

  REQUIRE(Ids(catalog.ListByProvider("openai")) ==
          std::vector<std::string>{"a"});
  REQUIRE(catalog.Providers() ==
          std::vector<std::string>{"anthropic", "openai"});

  REQUIRE(catalog.Unregister("b").ok());
  REQUIRE(catalog.Providers() == std::vector<std::string>{"openai"});
  REQUIRE(catalog.Capabilities() == std::vector<std::string>{"text"});
  REQUIRE(catalog.Unregister("b").code == ErrorCode::kBackendNotFound);
}

TEST_CASE("BackendCatalog stats count statuses and indexes",
          "[backend_catalog]") {
  BackendCatalog catalog;
  REQUIRE(catalog.Register(MakeBackend("a", "openai", {"text"})).ok());
  auto old = MakeBackend("b", "openai", {"text", "vision"});
  old.status = BackendStatus::kDeprecated;
  REQUIRE(catalog.Register(old).ok());

  auto stats = catalog.Stats();
  REQUIRE(stats.total == 2);
  REQUIRE(stats.active == 1);
  REQUIRE(stats.deprecated == 1);
  REQUIRE(stats.by_provider["openai"] == 2);
  REQUIRE(stats.by_capability["vision"] == 1);
}

TEST_CASE("BackendDescriptor cost is priced per million units",
          "[backend_catalog]") {
  auto d = MakeBackend("a", "openai", {"text"});
  REQUIRE(d.CalculateCost(1000000, 0) == Catch::Approx(3.0));
  REQUIRE(d.CalculateCost(1000, 500) ==
          Catch::Approx((1000 * 3.0 + 500 * 15.0) / 1e6));
}
