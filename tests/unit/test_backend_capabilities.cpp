#include <catch2/catch_all.hpp>

#include "runtime/backends/backend_capabilities.h"

using namespace switchyard;

TEST_CASE("CheckBackendCapabilities succeeds when requirements are empty",
          "[backend_capabilities]") {
  BackendCapabilities capabilities;
  BackendFeatureRequirements requirements;

  auto result = CheckBackendCapabilities(capabilities, requirements);
  REQUIRE(result.supported);
  REQUIRE(result.missing_feature.empty());
  REQUIRE(result.reason.empty());
}

TEST_CASE("CheckBackendCapabilities rejects unsupported vision",
          "[backend_capabilities]") {
  BackendCapabilities capabilities;
  capabilities.features = {"text", "tool_use"};

  BackendFeatureRequirements requirements;
  requirements.features = {"text", "vision"};

  auto result = CheckBackendCapabilities(capabilities, requirements);
  REQUIRE_FALSE(result.supported);
  REQUIRE(result.missing_feature == "vision");
  REQUIRE(result.reason.find("vision") != std::string::npos);
}

TEST_CASE("CheckBackendCapabilities treats streaming as a capability",
          "[backend_capabilities]") {
  BackendCapabilities capabilities;
  capabilities.features = {"text"};

  BackendFeatureRequirements requirements;
  requirements.needs_streaming = true;

  auto result = CheckBackendCapabilities(capabilities, requirements);
  REQUIRE_FALSE(result.supported);
  REQUIRE(result.missing_feature == "streaming");

  capabilities.features.insert("streaming");
  REQUIRE(CheckBackendCapabilities(capabilities, requirements).supported);
}

TEST_CASE("CheckBackendCapabilities matches requirements case-insensitively",
          "[backend_capabilities]") {
  BackendCapabilities capabilities;
  capabilities.features = {"vision"};

  BackendFeatureRequirements requirements;
  requirements.features = {" Vision "};

  REQUIRE(CheckBackendCapabilities(capabilities, requirements).supported);
}

TEST_CASE("NormalizeCapabilities lower-cases, trims and de-duplicates",
          "[backend_capabilities]") {
  auto out = NormalizeCapabilities({"Vision", "text", " TEXT ", "", "  "});
  REQUIRE(out == std::vector<std::string>{"text", "vision"});
}
