#pragma once

#include "runtime/response_cache/cache_store.h"

#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace switchyard {

// In-process CacheStore: TTL map with a global LRU list for capacity
// eviction and a per-scope recency list for similarity scans.
class MemoryCacheStore : public CacheStore {
 public:
  using ClockFn = std::function<CacheRecord::TimePoint()>;

  explicit MemoryCacheStore(std::size_t capacity = 10000, ClockFn clock = {});

  std::optional<CacheRecord> Get(const std::string& key) override;
  void Put(const CacheRecord& record) override;
  std::vector<CacheRecord> RecentInScope(const std::string& scope,
                                         std::size_t limit) override;
  std::size_t RemoveIf(
      const std::function<bool(const CacheRecord&)>& predicate) override;
  void Clear() override;
  std::size_t Size() override;

  std::size_t Capacity() const { return capacity_; }

 private:
  struct EntryState {
    CacheRecord record;
    std::list<std::string>::iterator lru_it;
    std::list<std::string>::iterator scope_it;
  };

  CacheRecord::TimePoint Now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
  }
  // Requires mutex_.
  void EraseLocked(std::unordered_map<std::string, EntryState>::iterator it);

  std::size_t capacity_;
  ClockFn clock_;
  std::unordered_map<std::string, EntryState> table_;
  std::list<std::string> lru_; // front = most recently read or written
  std::unordered_map<std::string, std::list<std::string>> scopes_;
  mutable std::mutex mutex_;
};

}  // namespace switchyard
