#include <catch2/catch_all.hpp>

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <sstream>

// ---------------------------------------------------------------------------
// Structured JSON / plain-text application logger
// ---------------------------------------------------------------------------

namespace {

// Captures log output for the lifetime of the guard.
struct CaptureLog {
  std::ostringstream out;
  CaptureLog() { switchyard::log::SetOutput(&out); }
  ~CaptureLog() {
    switchyard::log::SetOutput(nullptr);
    switchyard::log::SetJsonMode(false);
    switchyard::log::SetMinLevel(switchyard::log::Level::INFO);
  }
};

} // namespace

TEST_CASE("Logger defaults to plain-text mode", "[logger]") {
  switchyard::log::SetJsonMode(false);
  REQUIRE_FALSE(switchyard::log::IsJsonMode());
}

TEST_CASE("Logger can be switched to JSON mode", "[logger]") {
  switchyard::log::SetJsonMode(true);
  REQUIRE(switchyard::log::IsJsonMode());
  switchyard::log::SetJsonMode(false);
}

TEST_CASE("Logger text mode formats level, component and extra", "[logger]") {
  CaptureLog capture;
  switchyard::log::Warn("router", "no capable backend", "stage=capability");
  REQUIRE(capture.out.str() ==
          "[WARN] router: no capable backend | stage=capability\n");
}

TEST_CASE("Logger JSON mode emits one parseable object per line",
          "[logger]") {
  CaptureLog capture;
  switchyard::log::SetJsonMode(true);
  switchyard::log::Info("cache", "hit", "kind=exact");

  auto line = capture.out.str();
  REQUIRE(line.back() == '\n');
  auto j = nlohmann::json::parse(line.substr(0, line.size() - 1));
  REQUIRE(j["level"] == "INFO");
  REQUIRE(j["component"] == "cache");
  REQUIRE(j["message"] == "hit");
  REQUIRE(j["extra"] == "kind=exact");
  REQUIRE(j.contains("ts"));
}

TEST_CASE("Logger drops entries below the minimum level", "[logger]") {
  CaptureLog capture;
  switchyard::log::SetMinLevel(switchyard::log::Level::WARN);
  switchyard::log::Debug("test", "debug message");
  switchyard::log::Info("test", "info message");
  REQUIRE(capture.out.str().empty());
  switchyard::log::Error("test", "error message");
  REQUIRE(capture.out.str().find("error message") != std::string::npos);
}

TEST_CASE("Logger parses level names case-insensitively", "[logger]") {
  using switchyard::log::Level;
  REQUIRE(switchyard::log::ParseLevel("DEBUG") == Level::DEBUG);
  REQUIRE(switchyard::log::ParseLevel("warning") == Level::WARN);
  REQUIRE(switchyard::log::ParseLevel("Error") == Level::ERROR);
  REQUIRE_FALSE(switchyard::log::ParseLevel("verbose").has_value());
}

TEST_CASE("Logger mode toggle is thread-safe (no crash under concurrent calls)",
          "[logger]") {
  for (int i = 0; i < 100; ++i) {
    switchyard::log::SetJsonMode(i % 2 == 0);
    (void)switchyard::log::IsJsonMode();
  }
  switchyard::log::SetJsonMode(false);
  SUCCEED("Mode toggle did not crash");
}
