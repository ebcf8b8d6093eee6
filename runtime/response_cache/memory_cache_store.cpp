#include "runtime/response_cache/memory_cache_store.h"

#include <iterator>

namespace switchyard {

MemoryCacheStore::MemoryCacheStore(std::size_t capacity, ClockFn clock)
    : capacity_(capacity == 0 ? 1 : capacity), clock_(std::move(clock)) {}

std::optional<CacheRecord> MemoryCacheStore::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = table_.find(key);
  if (it == table_.end()) {
    return std::nullopt;
  }
  if (it->second.record.Expired(Now())) {
    EraseLocked(it);
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second.lru_it);
  return it->second.record;
}

void MemoryCacheStore::Put(const CacheRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = table_.find(record.key);
  if (existing != table_.end()) {
    EraseLocked(existing);
  }
  while (table_.size() >= capacity_ && !lru_.empty()) {
    EraseLocked(table_.find(lru_.back()));
  }
  lru_.push_front(record.key);
  auto& scope_list = scopes_[record.scope];
  scope_list.push_front(record.key);
  table_[record.key] = EntryState{record, lru_.begin(), scope_list.begin()};
}

std::vector<CacheRecord> MemoryCacheStore::RecentInScope(
    const std::string& scope, std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CacheRecord> out;
  auto scope_it = scopes_.find(scope);
  if (scope_it == scopes_.end()) {
    return out;
  }
  auto now = Now();
  for (const auto& key : scope_it->second) {
    if (out.size() >= limit) {
      break;
    }
    const auto& record = table_.at(key).record;
    if (record.embedding.empty() || record.Expired(now)) {
      continue;
    }
    out.push_back(record);
  }
  return out;
}

std::size_t MemoryCacheStore::RemoveIf(
    const std::function<bool(const CacheRecord&)>& predicate) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = table_.begin(); it != table_.end();) {
    auto next = std::next(it);
    if (predicate(it->second.record)) {
      EraseLocked(it);
      ++removed;
    }
    it = next;
  }
  return removed;
}

void MemoryCacheStore::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  table_.clear();
  lru_.clear();
  scopes_.clear();
}

std::size_t MemoryCacheStore::Size() {
  std::lock_guard<std::mutex> lock(mutex_);
  return table_.size();
}

void MemoryCacheStore::EraseLocked(
    std::unordered_map<std::string, EntryState>::iterator it) {
  lru_.erase(it->second.lru_it);
  auto scope_it = scopes_.find(it->second.record.scope);
  if (scope_it != scopes_.end()) {
    scope_it->second.erase(it->second.scope_it);
    if (scope_it->second.empty()) {
      scopes_.erase(scope_it);
    }
  }
  table_.erase(it);
}

}  // namespace switchyard
