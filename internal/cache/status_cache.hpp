#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/status_record.hpp"
#include "internal/util/time.hpp"

namespace stagesync::cache {

struct CacheOptions {
  std::chrono::milliseconds ttl{std::chrono::minutes(5)};
  std::size_t               max_entries{1000};
};

struct CacheStats {
  std::size_t   total_entries   = 0;
  std::size_t   dirty_entries   = 0;
  std::size_t   expired_entries = 0;
  std::uint64_t hits            = 0;
  std::uint64_t misses          = 0;
  double        hit_rate        = 0.0;
};

/*
  StatusCache

  In-memory artist status cache keyed by artist id.
    - TTL: every write resets expiry; reads do not.
    - LRU: inserting a new key at capacity evicts the least recently used
      entries; a write is never refused.
    - dirty tracking for write-behind persistence.

  One mutex guards every operation, so the version check in Update and the
  mutation that follows are atomic. Expiry is lazy (Get) or explicit
  (Cleanup); there are no internal timers.
*/
class StatusCache {
 public:
  explicit StatusCache(CacheOptions options = {}, std::shared_ptr<util::Clock> clock = std::make_shared<util::SystemClock>());

  std::optional<model::StatusRecord> Get(const std::string& artist_id);
  void                               Set(const std::string& artist_id, model::StatusRecord record);

  /*
    Merge patch into the cached record.

    Rejected (returns nullopt, nothing changes) when the artist is unknown or
    patch.version is older than the cached version. Otherwise the version
    becomes patch.version or cached+1, the timestamp patch.timestamp or now,
    and the entry turns dirty.
  */
  std::optional<model::StatusRecord> UpdateAndGet(const std::string& artist_id, const model::StatusPatch& patch);
  bool                               Update(const std::string& artist_id, const model::StatusPatch& patch);

  bool MarkDirty(const std::string& artist_id);
  bool MarkClean(const std::string& artist_id);

  // Clears dirty only when the cached version is not newer than persisted_version.
  bool MarkCleanIfNotNewer(const std::string& artist_id, std::uint64_t persisted_version);

  bool   Delete(const std::string& artist_id);
  void   Clear();
  size_t Cleanup();

  std::vector<model::StatusRecord> GetDirtyEntries() const;
  std::vector<model::StatusRecord> GetAllEntries() const;

  std::optional<util::TimePoint> LastSyncAt(const std::string& artist_id) const;

  CacheStats GetStats() const;
  void       ResetStats();
  size_t     Size() const;
  bool       Has(const std::string& artist_id) const;

 private:
  struct Entry {
    model::StatusRecord              record;
    util::TimePoint                  expires_at;
    std::optional<util::TimePoint>   last_sync_at;
    std::list<std::string>::iterator lru_it;
  };

  using EntryMap = std::unordered_map<std::string, Entry>;

  void Touch(Entry& entry);
  void EvictIfNeeded();
  void Erase(EntryMap::iterator it);

  CacheOptions                 options_;
  std::shared_ptr<util::Clock> clock_;

  mutable std::mutex     mutex_;
  EntryMap               entries_;
  std::list<std::string> lru_; // front = most recently used
  std::uint64_t          hits_   = 0;
  std::uint64_t          misses_ = 0;
};

} // namespace stagesync::cache
