#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace switchyard {

// One cached response. Wall-clock times so records survive restarts.
struct CacheRecord {
  using TimePoint = std::chrono::system_clock::time_point;

  std::string key;   // request fingerprint
  std::string scope; // similarity scope (capabilities + generation params)
  std::vector<float> embedding; // empty when similarity is disabled
  std::string response_json;
  std::string backend_id;
  TimePoint created_at;
  TimePoint expires_at;

  bool Expired(TimePoint now) const { return now >= expires_at; }
};

// CacheStore is the persistence seam behind ResponseCache. Implementations
// report infrastructure failures by throwing std::exception; ResponseCache
// turns every such failure into a miss or a no-op.
class CacheStore {
public:
  virtual ~CacheStore() = default;

  // Non-expired record for `key`.
  virtual std::optional<CacheRecord> Get(const std::string &key) = 0;

  // Inserts or replaces the record with the same key.
  virtual void Put(const CacheRecord &record) = 0;

  // Up to `limit` non-expired records of `scope` that carry an embedding,
  // most recently written first.
  virtual std::vector<CacheRecord> RecentInScope(const std::string &scope,
                                                 std::size_t limit) = 0;

  // Removes every record matching `predicate`; returns the count removed.
  virtual std::size_t
  RemoveIf(const std::function<bool(const CacheRecord &)> &predicate) = 0;

  virtual void Clear() = 0;
  virtual std::size_t Size() = 0;
};

} // namespace switchyard
