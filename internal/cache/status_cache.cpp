#include "internal/cache/status_cache.hpp"

namespace stagesync::cache {

StatusCache::StatusCache(CacheOptions options, std::shared_ptr<util::Clock> clock) : options_(options), clock_(std::move(clock)) {
  if (options_.max_entries == 0) {
    options_.max_entries = 1;
  }
}

void StatusCache::Touch(Entry& entry) {
  lru_.splice(lru_.begin(), lru_, entry.lru_it);
}

void StatusCache::Erase(EntryMap::iterator it) {
  lru_.erase(it->second.lru_it);
  entries_.erase(it);
}

void StatusCache::EvictIfNeeded() {
  while (entries_.size() >= options_.max_entries && !lru_.empty()) {
    auto it = entries_.find(lru_.back());
    if (it == entries_.end()) {
      lru_.pop_back();
      continue;
    }
    Erase(it);
  }
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<model::StatusRecord> StatusCache::Get(const std::string& artist_id) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(artist_id);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }

  if (it->second.expires_at < clock_->Now()) {
    Erase(it);
    ++misses_;
    return std::nullopt;
  }

  ++hits_;
  Touch(it->second);
  return it->second.record;
}

bool StatusCache::Has(const std::string& artist_id) const {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(artist_id);
  return it != entries_.end() && !(it->second.expires_at < clock_->Now());
}

size_t StatusCache::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

std::optional<util::TimePoint> StatusCache::LastSyncAt(const std::string& artist_id) const {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(artist_id);
  if (it == entries_.end()) return std::nullopt;

  return it->second.last_sync_at;
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

void StatusCache::Set(const std::string& artist_id, model::StatusRecord record) {
  if (artist_id.empty()) return;

  std::lock_guard lock(mutex_);
  const auto      now = clock_->Now();

  auto it = entries_.find(artist_id);
  if (it != entries_.end()) {
    it->second.record     = std::move(record);
    it->second.expires_at = now + options_.ttl;
    if (!it->second.record.dirty) it->second.last_sync_at = now;
    Touch(it->second);
    return;
  }

  EvictIfNeeded();

  lru_.push_front(artist_id);
  Entry entry;
  entry.record     = std::move(record);
  entry.expires_at = now + options_.ttl;
  if (!entry.record.dirty) entry.last_sync_at = now;
  entry.lru_it = lru_.begin();
  entries_.emplace(artist_id, std::move(entry));
}

std::optional<model::StatusRecord> StatusCache::UpdateAndGet(const std::string& artist_id, const model::StatusPatch& patch) {
  if (artist_id.empty()) return std::nullopt;

  std::lock_guard lock(mutex_);

  auto it = entries_.find(artist_id);
  if (it == entries_.end()) return std::nullopt;

  auto& record = it->second.record;
  if (patch.version && *patch.version < record.version) {
    return std::nullopt;
  }

  const auto now = clock_->Now();
  model::ApplyFields(record, patch);
  record.version   = patch.version ? *patch.version : record.version + 1;
  record.timestamp = patch.timestamp ? *patch.timestamp : now;
  record.dirty     = true;

  it->second.expires_at = now + options_.ttl;
  Touch(it->second);
  return record;
}

bool StatusCache::Update(const std::string& artist_id, const model::StatusPatch& patch) {
  return UpdateAndGet(artist_id, patch).has_value();
}

bool StatusCache::MarkDirty(const std::string& artist_id) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(artist_id);
  if (it == entries_.end()) return false;

  it->second.record.dirty = true;
  return true;
}

bool StatusCache::MarkClean(const std::string& artist_id) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(artist_id);
  if (it == entries_.end()) return false;

  it->second.record.dirty = false;
  it->second.last_sync_at  = clock_->Now();
  return true;
}

bool StatusCache::MarkCleanIfNotNewer(const std::string& artist_id, std::uint64_t persisted_version) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(artist_id);
  if (it == entries_.end() || it->second.record.version > persisted_version) return false;

  it->second.record.dirty = false;
  it->second.last_sync_at = clock_->Now();
  return true;
}

bool StatusCache::Delete(const std::string& artist_id) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(artist_id);
  if (it == entries_.end()) return false;

  Erase(it);
  return true;
}

void StatusCache::Clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
  lru_.clear();
}

size_t StatusCache::Cleanup() {
  std::lock_guard lock(mutex_);
  const auto      now = clock_->Now();

  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at < now) {
      lru_.erase(it->second.lru_it);
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

std::vector<model::StatusRecord> StatusCache::GetDirtyEntries() const {
  std::lock_guard lock(mutex_);

  std::vector<model::StatusRecord> dirty;
  for (const auto& [_, entry] : entries_) {
    if (entry.record.dirty) dirty.push_back(entry.record);
  }
  return dirty;
}

std::vector<model::StatusRecord> StatusCache::GetAllEntries() const {
  std::lock_guard lock(mutex_);

  std::vector<model::StatusRecord> all;
  all.reserve(entries_.size());
  for (const auto& [_, entry] : entries_) {
    all.push_back(entry.record);
  }
  return all;
}

CacheStats StatusCache::GetStats() const {
  std::lock_guard lock(mutex_);
  const auto      now = clock_->Now();

  CacheStats stats;
  stats.total_entries = entries_.size();
  for (const auto& [_, entry] : entries_) {
    if (entry.record.dirty) ++stats.dirty_entries;
    if (entry.expires_at < now) ++stats.expired_entries;
  }
  stats.hits   = hits_;
  stats.misses = misses_;

  const auto lookups = hits_ + misses_;
  stats.hit_rate     = lookups == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(lookups);
  return stats;
}

void StatusCache::ResetStats() {
  std::lock_guard lock(mutex_);
  hits_   = 0;
  misses_ = 0;
}

} // namespace stagesync::cache
