#include <catch2/catch_all.hpp>

#include "runtime/response_cache/file_cache_store.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace switchyard;
using namespace std::chrono_literals;

namespace {

// Fresh, empty directory per test case; removed on scope exit.
struct TempDir {
  fs::path path;
  explicit TempDir(const std::string &name)
      : path(fs::temp_directory_path() / ("switchyard_" + name)) {
    fs::remove_all(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

CacheRecord Record(const std::string &key, std::chrono::seconds ttl = 3600s) {
  auto now = std::chrono::system_clock::now();
  CacheRecord record;
  record.key = key;
  record.scope = "scope";
  record.embedding = {0.5f, 0.5f};
  record.response_json = R"({"content":"hi"})";
  record.backend_id = "claude-sonnet";
  record.created_at = now;
  record.expires_at = now + ttl;
  return record;
}

} // namespace

TEST_CASE("CacheRecord JSON conversion keeps every field", "[file_cache]") {
  auto record = Record("abc123");
  auto back = CacheRecordFromJson(CacheRecordToJson(record));
  REQUIRE(back.key == record.key);
  REQUIRE(back.scope == record.scope);
  REQUIRE(back.embedding == record.embedding);
  REQUIRE(back.response_json == record.response_json);
  REQUIRE(back.backend_id == record.backend_id);
  REQUIRE(std::chrono::duration_cast<std::chrono::milliseconds>(
              back.expires_at - record.expires_at)
              .count() == 0);
}

TEST_CASE("CacheRecordFromJson rejects records without a key",
          "[file_cache]") {
  nlohmann::json j = {{"scope", "s"}};
  REQUIRE_THROWS_AS(CacheRecordFromJson(j), nlohmann::json::exception);
}

TEST_CASE("FileCacheStore entries survive a restart", "[file_cache]") {
  TempDir dir("file_cache_restart");
  {
    FileCacheStore store(dir.path);
    store.Put(Record("aa11"));
    store.Put(Record("bb22"));
    store.Flush();
    REQUIRE(fs::exists(dir.path / "aa11.json"));
  }
  FileCacheStore reopened(dir.path);
  REQUIRE(reopened.loaded_on_start() == 2);
  auto got = reopened.Get("aa11");
  REQUIRE(got.has_value());
  REQUIRE(got->response_json == R"({"content":"hi"})");
  REQUIRE(reopened.RecentInScope("scope", 10).size() == 2);
}

TEST_CASE("FileCacheStore drops expired and corrupt files on load",
          "[file_cache]") {
  TempDir dir("file_cache_cleanup");
  {
    FileCacheStore store(dir.path);
    store.Put(Record("cc33", -10s));
    store.Put(Record("dd44"));
    store.Flush();
  }
  {
    std::ofstream junk(dir.path / "ee55.json");
    junk << "{not json";
  }
  FileCacheStore reopened(dir.path);
  REQUIRE(reopened.loaded_on_start() == 1);
  REQUIRE(reopened.Get("dd44").has_value());
  REQUIRE_FALSE(fs::exists(dir.path / "cc33.json"));
  REQUIRE_FALSE(fs::exists(dir.path / "ee55.json"));
}

TEST_CASE("FileCacheStore RemoveIf deletes files", "[file_cache]") {
  TempDir dir("file_cache_remove");
  FileCacheStore store(dir.path);
  store.Put(Record("aa11"));
  store.Flush();
  REQUIRE(store.RemoveIf([](const CacheRecord &) { return true; }) == 1);
  store.Flush();
  REQUIRE(store.Size() == 0);
  REQUIRE_FALSE(fs::exists(dir.path / "aa11.json"));
}

TEST_CASE("FileCacheStore rejects keys that are not hex", "[file_cache]") {
  TempDir dir("file_cache_keys");
  FileCacheStore store(dir.path);
  REQUIRE_THROWS_AS(store.Put(Record("../escape")), std::invalid_argument);
  REQUIRE(store.Size() == 0);
}
