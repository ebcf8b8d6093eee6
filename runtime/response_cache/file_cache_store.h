#pragma once

#include "io/async_file_writer.h"
#include "runtime/response_cache/memory_cache_store.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace switchyard {

nlohmann::json CacheRecordToJson(const CacheRecord &record);
// Throws nlohmann::json::exception on a malformed record.
CacheRecord CacheRecordFromJson(const nlohmann::json &j);

// CacheStore backed by a directory of JSON records, one file per
// fingerprint. Reads are served from an in-memory index; writes and removals
// go through an AsyncFileWriter (write-behind). The directory is scanned on
// construction so entries survive restarts; expired or unreadable files are
// removed during the scan.
class FileCacheStore : public CacheStore {
public:
  FileCacheStore(std::filesystem::path directory, std::size_t capacity = 10000,
                 MemoryCacheStore::ClockFn clock = {});
  ~FileCacheStore() override;

  std::optional<CacheRecord> Get(const std::string &key) override;
  void Put(const CacheRecord &record) override;
  std::vector<CacheRecord> RecentInScope(const std::string &scope,
                                         std::size_t limit) override;
  std::size_t
  RemoveIf(const std::function<bool(const CacheRecord &)> &predicate) override;
  void Clear() override;
  std::size_t Size() override;

  // Blocks until pending writes and removals reached the disk.
  void Flush();

  const std::filesystem::path &directory() const { return directory_; }
  std::size_t loaded_on_start() const { return loaded_on_start_; }

private:
  void LoadExisting();
  std::filesystem::path PathFor(const std::string &key) const;
  void EnqueueRemove(const std::string &key);

  std::filesystem::path directory_;
  MemoryCacheStore::ClockFn clock_;
  MemoryCacheStore index_;
  AsyncFileWriter writer_;
  std::size_t loaded_on_start_{0};
};

} // namespace switchyard
