#include "internal/sync/sync_service.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "internal/conflict/conflict_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/status_codec.hpp"
#include "internal/util/errors.hpp"
#include "stagesync/v1/status.pb.h"

namespace stagesync::sync {

using observability::IntField;
using observability::StringField;

std::string_view ToString(SyncDirection direction) {
  switch (direction) {
    case SyncDirection::kBidirectional:
      return "bidirectional";
    case SyncDirection::kRemoteToLocal:
      return "remote-to-local";
    case SyncDirection::kLocalToRemote:
      return "local-to-remote";
  }
  return "bidirectional";
}

std::string_view ToString(ItemType type) {
  switch (type) {
    case ItemType::kStatus:
      return "status";
    case ItemType::kCounter:
      return "counter";
  }
  return "status";
}

std::string_view ToString(ConflictReason reason) {
  switch (reason) {
    case ConflictReason::kTimestamp:
      return "timestamp";
    case ConflictReason::kVersion:
      return "version";
    case ConflictReason::kDataMismatch:
      return "data-mismatch";
  }
  return "data-mismatch";
}

std::string_view ToString(ResolutionKind resolution) {
  switch (resolution) {
    case ResolutionKind::kLocalWins:
      return "local-wins";
    case ResolutionKind::kRemoteWins:
      return "remote-wins";
    case ResolutionKind::kManual:
      return "manual";
    case ResolutionKind::kMerge:
      return "merge";
  }
  return "local-wins";
}

namespace {

class SyncGuard {
 public:
  explicit SyncGuard(std::atomic<bool>& flag) : flag_(flag) {
  }
  ~SyncGuard() {
    flag_ = false;
  }

  SyncGuard(const SyncGuard&)            = delete;
  SyncGuard& operator=(const SyncGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

SyncDirection ParseDirection(const std::string& text) {
  if (text == "remote-to-local") return SyncDirection::kRemoteToLocal;
  if (text == "local-to-remote") return SyncDirection::kLocalToRemote;
  return SyncDirection::kBidirectional;
}

std::string CounterJson(uint64_t value) {
  stagesync::v1::CounterDocument doc;
  doc.set_current_id(value);
  return store::ToJson(doc);
}

std::map<std::string, model::StatusRecord> IndexByArtist(std::vector<model::StatusRecord> records) {
  std::map<std::string, model::StatusRecord> index;
  for (auto& record : records) {
    auto artist_id = record.artist_id;
    index.insert_or_assign(std::move(artist_id), std::move(record));
  }
  return index;
}

} // namespace

SyncService::SyncService(std::shared_ptr<store::StatusRepository> local, std::shared_ptr<store::StatusRepository> remote, SyncOptions options,
                         std::shared_ptr<util::Clock> clock)
    : local_(std::move(local)), remote_(std::move(remote)), options_(options), clock_(std::move(clock)) {
}

SyncResult SyncService::SyncData() {
  return Run(SyncDirection::kBidirectional);
}

SyncResult SyncService::SyncFromRemoteToLocal() {
  return Run(SyncDirection::kRemoteToLocal);
}

SyncResult SyncService::SyncFromLocalToRemote() {
  return Run(SyncDirection::kLocalToRemote);
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

SyncResult SyncService::Run(SyncDirection direction) {
  bool expected = false;
  if (!syncing_.compare_exchange_strong(expected, true)) {
    throw util::SyncInProgress("a sync run is already in progress");
  }
  SyncGuard guard(syncing_);

  observability::SpanScope span("SyncService.Sync");
  span.SetAttribute("direction", ToString(direction));
  const auto started_at = std::chrono::steady_clock::now();

  SyncResult result;
  auto       finish = [&]() {
    result.success  = result.errors.empty();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at);
    observability::Metrics::Instance().ObserveSyncDurationMs(ToString(direction), result.success,
                                                             std::chrono::duration<double, std::milli>(result.duration).count());
  };

  if (!remote_->Ping()) {
    result.errors.emplace_back("remote store unavailable");
    span.RecordException("remote store unavailable");
    STAGESYNC_LOG_WARN("Sync skipped", {StringField("direction", ToString(direction)), StringField("reason", "remote store unavailable")});
    finish();
    return result;
  }

  std::uint64_t total_items = 0;

  auto run_class = [&](std::string_view label, auto&& fn) {
    try {
      fn();
    } catch (const std::exception& e) {
      result.errors.push_back(std::string(label) + ": " + e.what());
      span.RecordException(e.what());
    }
  };

  switch (direction) {
    case SyncDirection::kBidirectional:
      run_class("status records", [&] { ReconcileStatuses(result, total_items); });
      run_class("counters", [&] { ReconcileCounters(result, total_items); });
      break;
    case SyncDirection::kRemoteToLocal:
      run_class("status records", [&] { CopyStatuses(*remote_, *local_, result, total_items); });
      run_class("counters", [&] { CopyCounters(*remote_, *local_, result, total_items); });
      break;
    case SyncDirection::kLocalToRemote:
      run_class("status records", [&] { CopyStatuses(*local_, *remote_, result, total_items); });
      run_class("counters", [&] { CopyCounters(*local_, *remote_, result, total_items); });
      break;
  }

  SyncMetadata metadata;
  if (auto previous = GetLastSyncMetadata()) {
    metadata.version = previous->version;
  }
  metadata.version += 1;
  metadata.last_sync      = clock_->Now();
  metadata.total_items    = total_items;
  metadata.conflict_count = result.conflicts.size();
  metadata.sync_direction = direction;
  run_class("metadata", [&] { SaveMetadata(metadata); });
  result.metadata = metadata;

  finish();

  if (result.success) {
    STAGESYNC_LOG_INFO("Sync completed", {StringField("direction", ToString(direction)), IntField("items_synced", result.items_synced),
                                          IntField("conflicts", static_cast<std::int64_t>(result.conflicts.size())),
                                          IntField("duration_ms", result.duration.count())});
  } else {
    STAGESYNC_LOG_WARN("Sync completed with errors", {StringField("direction", ToString(direction)), IntField("items_synced", result.items_synced),
                                                      IntField("errors", static_cast<std::int64_t>(result.errors.size())),
                                                      StringField("first_error", result.errors.front())});
  }
  return result;
}

// ------------------------------------------------------------
// Bidirectional
// ------------------------------------------------------------

void SyncService::ReconcileStatuses(SyncResult& result, std::uint64_t& total_items) {
  std::set<std::string> events;
  for (auto& event : local_->ListEvents()) events.insert(std::move(event));
  for (auto& event : remote_->ListEvents()) events.insert(std::move(event));

  const conflict::ResolveOptions resolve_options{options_.detection_skew};

  for (const auto& event_id : events) {
    auto local_records  = IndexByArtist(local_->ListStatuses(event_id));
    auto remote_records = IndexByArtist(remote_->ListStatuses(event_id));

    std::set<std::string> artists;
    for (const auto& [artist_id, _] : local_records) artists.insert(artist_id);
    for (const auto& [artist_id, _] : remote_records) artists.insert(artist_id);

    for (const auto& artist_id : artists) {
      ++total_items;
      auto l = local_records.find(artist_id);
      auto r = remote_records.find(artist_id);

      if (r == remote_records.end()) {
        remote_->PutStatus(l->second);
        ++result.items_synced;
        continue;
      }
      if (l == local_records.end()) {
        local_->PutStatus(r->second);
        ++result.items_synced;
        continue;
      }

      const auto& local  = l->second;
      const auto& remote = r->second;
      const auto  delta  = local.timestamp > remote.timestamp ? local.timestamp - remote.timestamp : remote.timestamp - local.timestamp;
      const bool  skewed = delta > options_.detection_skew;

      if (!skewed && model::SameTrackedFields(local, remote)) continue;

      auto resolution = conflict::ConflictResolver::Resolve(local, remote, resolve_options);
      if (resolution.winner == conflict::Winner::kLocal) {
        remote_->PutStatus(resolution.resolved);
      } else {
        local_->PutStatus(resolution.resolved);
      }
      ++result.items_synced;

      SyncConflict record;
      record.item_id   = event_id + "/" + artist_id;
      record.item_type = ItemType::kStatus;
      if (skewed) {
        record.conflict_reason = ConflictReason::kTimestamp;
      } else if (local.version != remote.version) {
        record.conflict_reason = ConflictReason::kVersion;
      } else {
        record.conflict_reason = ConflictReason::kDataMismatch;
      }
      record.resolution       = resolution.winner == conflict::Winner::kLocal ? ResolutionKind::kLocalWins : ResolutionKind::kRemoteWins;
      record.local_version    = store::EncodeStatus(local);
      record.remote_version   = store::EncodeStatus(remote);
      record.resolved_version = store::EncodeStatus(resolution.resolved);
      result.conflicts.push_back(std::move(record));

      STAGESYNC_LOG_INFO("Sync conflict resolved", {StringField("item_id", event_id + "/" + artist_id),
                                                    StringField("detail", conflict::ConflictResolver::DescribeConflict(resolution))});
    }
  }
}

void SyncService::ReconcileCounters(SyncResult& result, std::uint64_t& total_items) {
  std::set<std::string> names;
  for (auto& name : local_->ListCounters()) names.insert(std::move(name));
  for (auto& name : remote_->ListCounters()) names.insert(std::move(name));

  for (const auto& name : names) {
    ++total_items;
    auto local  = local_->GetCounter(name);
    auto remote = remote_->GetCounter(name);

    if (!remote) {
      remote_->PutCounter(name, *local);
      ++result.items_synced;
      continue;
    }
    if (!local) {
      local_->PutCounter(name, *remote);
      ++result.items_synced;
      continue;
    }
    if (*local == *remote) continue;

    // Counters only move forward, so the larger value is the truth for both.
    const auto merged = std::max(*local, *remote);
    if (*local < merged) local_->PutCounter(name, merged);
    if (*remote < merged) remote_->PutCounter(name, merged);
    ++result.items_synced;

    SyncConflict record;
    record.item_id          = name;
    record.item_type        = ItemType::kCounter;
    record.conflict_reason  = ConflictReason::kVersion;
    record.resolution       = ResolutionKind::kMerge;
    record.local_version    = CounterJson(*local);
    record.remote_version   = CounterJson(*remote);
    record.resolved_version = CounterJson(merged);
    result.conflicts.push_back(std::move(record));
  }
}

// ------------------------------------------------------------
// One-way
// ------------------------------------------------------------

void SyncService::CopyStatuses(store::StatusRepository& from, store::StatusRepository& to, SyncResult& result, std::uint64_t& total_items) {
  for (const auto& event_id : from.ListEvents()) {
    for (const auto& record : from.ListStatuses(event_id)) {
      ++total_items;
      to.PutStatus(record);
      ++result.items_synced;
    }
  }
}

void SyncService::CopyCounters(store::StatusRepository& from, store::StatusRepository& to, SyncResult& result, std::uint64_t& total_items) {
  for (const auto& name : from.ListCounters()) {
    auto value = from.GetCounter(name);
    if (!value) continue;
    ++total_items;
    to.PutCounter(name, *value);
    ++result.items_synced;
  }
}

// ------------------------------------------------------------
// Metadata
// ------------------------------------------------------------

void SyncService::SaveMetadata(const SyncMetadata& metadata) {
  stagesync::v1::SyncMetadataDocument doc;
  *doc.mutable_last_sync() = util::ToProto(metadata.last_sync);
  doc.set_version(metadata.version);
  doc.set_total_items(metadata.total_items);
  doc.set_conflict_count(metadata.conflict_count);
  doc.set_sync_direction(std::string(ToString(metadata.sync_direction)));
  local_->Store()->Put(kMetadataKey, store::ToJson(doc));
}

std::optional<SyncMetadata> SyncService::GetLastSyncMetadata() {
  try {
    auto json = local_->Store()->Get(kMetadataKey);
    if (!json) return std::nullopt;

    stagesync::v1::SyncMetadataDocument doc;
    store::FromJson(*json, &doc);

    SyncMetadata metadata;
    metadata.last_sync      = util::FromProto(doc.last_sync());
    metadata.version        = doc.version();
    metadata.total_items    = doc.total_items();
    metadata.conflict_count = doc.conflict_count();
    metadata.sync_direction = ParseDirection(doc.sync_direction());
    return metadata;
  } catch (const std::exception& e) {
    STAGESYNC_LOG_WARN("Sync metadata unreadable", {StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace stagesync::sync
