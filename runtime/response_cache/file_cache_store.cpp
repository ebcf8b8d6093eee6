#include "runtime/response_cache/file_cache_store.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace switchyard {

namespace {

int64_t ToMillis(CacheRecord::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

CacheRecord::TimePoint FromMillis(int64_t ms) {
  return CacheRecord::TimePoint(std::chrono::milliseconds(ms));
}

// Fingerprints are lowercase hex; anything else would escape the directory.
bool IsSafeKey(const std::string &key) {
  return !key.empty() &&
         std::all_of(key.begin(), key.end(), [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

} // namespace

json CacheRecordToJson(const CacheRecord &record) {
  json j;
  j["key"] = record.key;
  j["scope"] = record.scope;
  j["embedding"] = record.embedding;
  j["response"] = record.response_json;
  j["backend_id"] = record.backend_id;
  j["created_at_ms"] = ToMillis(record.created_at);
  j["expires_at_ms"] = ToMillis(record.expires_at);
  return j;
}

CacheRecord CacheRecordFromJson(const json &j) {
  CacheRecord record;
  record.key = j.at("key").get<std::string>();
  record.scope = j.at("scope").get<std::string>();
  record.embedding = j.value("embedding", std::vector<float>{});
  record.response_json = j.at("response").get<std::string>();
  record.backend_id = j.value("backend_id", std::string{});
  record.created_at = FromMillis(j.at("created_at_ms").get<int64_t>());
  record.expires_at = FromMillis(j.at("expires_at_ms").get<int64_t>());
  return record;
}

FileCacheStore::FileCacheStore(std::filesystem::path directory,
                               std::size_t capacity,
                               MemoryCacheStore::ClockFn clock)
    : directory_(std::move(directory)), clock_(clock),
      index_(capacity, std::move(clock)) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("cannot create cache directory " +
                             directory_.string() + ": " + ec.message());
  }
  LoadExisting();
  writer_.Start();
}

FileCacheStore::~FileCacheStore() { writer_.Stop(); }

std::optional<CacheRecord> FileCacheStore::Get(const std::string &key) {
  return index_.Get(key);
}

void FileCacheStore::Put(const CacheRecord &record) {
  if (!IsSafeKey(record.key)) {
    throw std::invalid_argument("cache key is not a hex fingerprint");
  }
  index_.Put(record);
  AsyncWriteTask task;
  task.path = PathFor(record.key);
  task.contents = CacheRecordToJson(record).dump();
  if (!writer_.Enqueue(std::move(task))) {
    throw std::runtime_error("cache writer stopped");
  }
}

std::vector<CacheRecord> FileCacheStore::RecentInScope(const std::string &scope,
                                                       std::size_t limit) {
  return index_.RecentInScope(scope, limit);
}

std::size_t FileCacheStore::RemoveIf(
    const std::function<bool(const CacheRecord &)> &predicate) {
  std::vector<std::string> removed_keys;
  auto removed = index_.RemoveIf([&](const CacheRecord &record) {
    if (predicate(record)) {
      removed_keys.push_back(record.key);
      return true;
    }
    return false;
  });
  for (const auto &key : removed_keys) {
    EnqueueRemove(key);
  }
  return removed;
}

void FileCacheStore::Clear() {
  RemoveIf([](const CacheRecord &) { return true; });
}

std::size_t FileCacheStore::Size() { return index_.Size(); }

void FileCacheStore::Flush() { writer_.Flush(); }

void FileCacheStore::LoadExisting() {
  auto now = clock_ ? clock_() : std::chrono::system_clock::now();
  std::vector<CacheRecord> records;
  std::error_code ec;
  for (const auto &entry :
       std::filesystem::directory_iterator(directory_, ec)) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
      continue;
    }
    std::ifstream in(entry.path());
    std::stringstream buf;
    buf << in.rdbuf();
    try {
      auto record = CacheRecordFromJson(json::parse(buf.str()));
      if (record.Expired(now) || !IsSafeKey(record.key)) {
        std::filesystem::remove(entry.path(), ec);
        continue;
      }
      records.push_back(std::move(record));
    } catch (const json::exception &ex) {
      log::Warn("file_cache_store",
                "dropping unreadable cache file " + entry.path().string(),
                ex.what());
      std::filesystem::remove(entry.path(), ec);
    }
  }
  if (ec) {
    log::Warn("file_cache_store", "cannot scan cache directory",
              ec.message());
  }
  // Oldest first so the recency order matches write order.
  std::sort(records.begin(), records.end(),
            [](const CacheRecord &a, const CacheRecord &b) {
              return a.created_at < b.created_at;
            });
  for (const auto &record : records) {
    index_.Put(record);
  }
  loaded_on_start_ = records.size();
  if (!records.empty()) {
    log::Info("file_cache_store",
              "loaded " + std::to_string(records.size()) + " cache records",
              "dir=" + directory_.string());
  }
}

std::filesystem::path FileCacheStore::PathFor(const std::string &key) const {
  return directory_ / (key + ".json");
}

void FileCacheStore::EnqueueRemove(const std::string &key) {
  AsyncWriteTask task;
  task.op = AsyncFileOp::kRemove;
  task.path = PathFor(key);
  if (!writer_.Enqueue(std::move(task))) {
    log::Warn("file_cache_store", "writer stopped; cache file kept",
              "key=" + key);
  }
}

} // namespace switchyard
