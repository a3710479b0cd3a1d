#include "internal/core/cache_manager.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/status_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "stagesync/v1/status.pb.h"

namespace stagesync::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

std::string_view ToString(ManagerState state) {
  switch (state) {
    case ManagerState::kUninitialized:
      return "uninitialized";
    case ManagerState::kInitializing:
      return "initializing";
    case ManagerState::kReady:
      return "ready";
    case ManagerState::kDestroyed:
      return "destroyed";
  }
  return "uninitialized";
}

namespace {

// Records without a date belong to every performance of the event.
bool OnPerformanceDate(const model::StatusRecord& record, const std::optional<std::string>& performance_date) {
  if (!performance_date || performance_date->empty() || !record.performance_date) return true;
  return record.performance_date->substr(0, 10) == performance_date->substr(0, 10);
}

} // namespace

CacheManager::CacheManager(std::shared_ptr<cache::StatusCache> cache, std::shared_ptr<queue::UpdateQueue> queue,
                           std::shared_ptr<store::StatusRepository> durable, std::shared_ptr<notify::ChangeChannel> channel,
                           CacheManagerOptions options, std::shared_ptr<util::Clock> clock)
    : cache_(std::move(cache)),
      queue_(std::move(queue)),
      durable_(std::move(durable)),
      channel_(std::move(channel)),
      options_(std::move(options)),
      clock_(std::move(clock)),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
  if (!cache_ || !queue_ || !durable_) {
    throw std::invalid_argument("CacheManager requires a cache, a queue and a durable repository");
  }
  if (options_.origin_id.empty()) {
    options_.origin_id = util::NewId("origin");
  }

  auto alive = alive_;
  queue_->OnPersisted([this, alive](const queue::QueuedUpdate& update, const model::StatusRecord& durable_record) {
    if (!*alive) return;
    // A refused write that still wins is requeued by the settlement itself.
    static_cast<void>(SettlePersisted(update.updates, durable_record));
  });
  queue_->OnTerminalFailure([this, alive](const queue::QueuedUpdate& update) {
    if (!*alive) return;
    ++sync_errors_;
    std::vector<FailureListener> listeners;
    {
      std::lock_guard lock(context_mutex_);
      listeners = failure_listeners_;
    }
    for (const auto& listener : listeners) listener(update);
  });
}

CacheManager::~CacheManager() {
  *alive_ = false;
  StopTasks();
  if (channel_ && subscription_) {
    channel_->Unsubscribe(*subscription_);
  }
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void CacheManager::Initialize(const std::string& event_id, const std::optional<std::string>& performance_date) {
  if (event_id.empty()) {
    throw util::InvalidArgument("Initialize requires an event id");
  }

  std::lock_guard lifecycle(lifecycle_mutex_);
  if (state_ == ManagerState::kReady) {
    const auto current = EventId();
    if (current == event_id) return;
    throw util::InvalidState("cache manager is initialized for event " + current + "; destroy it before switching to " + event_id);
  }

  observability::SpanScope span("CacheManager.Initialize");
  span.SetAttribute("event_id", event_id);

  state_ = ManagerState::kInitializing;
  {
    std::lock_guard lock(context_mutex_);
    event_id_         = event_id;
    performance_date_ = performance_date;
  }

  try {
    std::size_t warmed = 0;
    try {
      warmed = LoadFromStorage(event_id, performance_date);
    } catch (const util::StoreUnavailable& e) {
      // Starting cold is fine: reads fall through to the store once it is back.
      STAGESYNC_LOG_WARN("Cache warmup skipped", {StringField("event_id", event_id), StringField("error", e.what())});
    }

    if (channel_) {
      auto alive = alive_;
      auto id    = channel_->Subscribe(notify::StatusTopic(event_id), [this, alive](const std::string&, const std::string& payload) {
        if (!*alive) return;
        HandleNotification(payload);
      });
      std::lock_guard lock(context_mutex_);
      subscription_ = id;
    }

    std::size_t restored = 0;
    try {
      restored = queue_->Restore();
    } catch (const util::StoreUnavailable& e) {
      STAGESYNC_LOG_WARN("Queue journal unavailable, starting with an empty queue", {StringField("error", e.what())});
    }

    if (options_.start_background_tasks) StartTasks();

    state_ = ManagerState::kReady;
    STAGESYNC_LOG_INFO("Cache manager ready", {StringField("event_id", event_id), IntField("warmed", static_cast<std::int64_t>(warmed)),
                                               IntField("restored_updates", static_cast<std::int64_t>(restored)),
                                               StringField("origin_id", options_.origin_id)});
  } catch (const std::exception& e) {
    StopTasks();
    if (channel_ && subscription_) {
      channel_->Unsubscribe(*subscription_);
    }
    {
      std::lock_guard lock(context_mutex_);
      subscription_.reset();
      event_id_.clear();
      performance_date_.reset();
    }
    state_ = ManagerState::kUninitialized;
    span.RecordException(e.what());
    throw;
  }
}

void CacheManager::Destroy() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (state_ != ManagerState::kReady) return;

  observability::SpanScope span("CacheManager.Destroy");
  StopTasks();

  // Best effort: anything that fails here is still in the queue.
  std::size_t flushed = 0;
  for (const auto& record : cache_->GetDirtyEntries()) {
    if (PersistRecord(record)) ++flushed;
  }

  std::optional<notify::ChangeChannel::SubscriptionId> subscription;
  std::string                                          event_id;
  {
    std::lock_guard lock(context_mutex_);
    subscription = subscription_;
    subscription_.reset();
    event_id = event_id_;
    event_id_.clear();
    performance_date_.reset();
    conflicts_.clear();
  }
  if (channel_ && subscription) {
    channel_->Unsubscribe(*subscription);
  }

  cache_->Clear();
  state_ = ManagerState::kDestroyed;
  STAGESYNC_LOG_INFO("Cache manager destroyed", {StringField("event_id", event_id), IntField("flushed", static_cast<std::int64_t>(flushed)),
                                                 IntField("pending_updates", static_cast<std::int64_t>(queue_->Size()))});
}

void CacheManager::StartTasks() {
  // Callbacks hold their targets: a task stopped from its own thread finishes the current run detached.
  drain_task_   = std::make_unique<runtime::PeriodicTask>("queue-drain", options_.drain_interval, [queue = queue_] { queue->Process(); });
  cleanup_task_ = std::make_unique<runtime::PeriodicTask>("cache-cleanup", options_.cleanup_interval, [cache = cache_] { cache->Cleanup(); });
  drain_task_->Start();
  cleanup_task_->Start();
}

void CacheManager::StopTasks() {
  if (drain_task_) drain_task_->Stop();
  if (cleanup_task_) cleanup_task_->Stop();
  drain_task_.reset();
  cleanup_task_.reset();
}

void CacheManager::EnsureReady(std::string_view operation) const {
  if (state_ != ManagerState::kReady) {
    throw util::InvalidState(std::string(operation) + " requires an initialized cache manager (state " + std::string(ToString(state_)) + ")");
  }
}

void CacheManager::EnsureEvent(const std::string& event_id) const {
  const auto current = EventId();
  if (event_id != current) {
    throw util::InvalidArgument("event " + event_id + " is not the managed event " + current);
  }
}

std::string CacheManager::EventId() const {
  std::lock_guard lock(context_mutex_);
  return event_id_;
}

std::size_t CacheManager::LoadFromStorage(const std::string& event_id, const std::optional<std::string>& performance_date) {
  std::size_t loaded = 0;
  for (auto& record : durable_->ListStatuses(event_id)) {
    if (!OnPerformanceDate(record, performance_date)) continue;
    record.dirty   = false;
    auto artist_id = record.artist_id;
    cache_->Set(artist_id, std::move(record));
    ++loaded;
  }
  return loaded;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<model::StatusRecord> CacheManager::GetArtistStatus(const std::string& artist_id) {
  EnsureReady("GetArtistStatus");
  ++total_operations_;

  if (auto cached = cache_->Get(artist_id)) {
    observability::Metrics::Instance().RecordCacheLookup(true);
    return cached;
  }
  observability::Metrics::Instance().RecordCacheLookup(false);
  if (artist_id.empty()) return std::nullopt;

  try {
    auto record = durable_->GetStatus(EventId(), artist_id);
    if (!record) return std::nullopt;
    record->dirty = false;
    cache_->Set(artist_id, *record);
    return record;
  } catch (const std::exception& e) {
    STAGESYNC_LOG_WARN("Status read-through failed", {StringField("artist_id", artist_id), StringField("error", e.what())});
    return std::nullopt;
  }
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

WriteResult CacheManager::UpdateArtistStatus(const std::string& artist_id, const model::StatusPatch& patch,
                                             std::optional<queue::UpdatePriority> priority) {
  EnsureReady("UpdateArtistStatus");
  if (artist_id.empty()) {
    throw util::InvalidArgument("UpdateArtistStatus requires an artist id");
  }

  observability::SpanScope span("CacheManager.UpdateArtistStatus");
  span.SetAttribute("artist_id", artist_id);
  ++total_operations_;

  const auto event_id = EventId();

  WriteResult result;
  result.artist_id = artist_id;

  if (!cache_->Has(artist_id)) {
    std::optional<model::StatusRecord> seed;
    try {
      seed = durable_->GetStatus(event_id, artist_id);
    } catch (const std::exception& e) {
      STAGESYNC_LOG_WARN("Status read-through failed, seeding a new record",
                         {StringField("artist_id", artist_id), StringField("error", e.what())});
    }
    if (!seed) {
      seed.emplace();
      seed->artist_id = artist_id;
      seed->event_id  = event_id;
      seed->timestamp = clock_->Now();
    }
    seed->dirty = false;
    cache_->Set(artist_id, *seed);
  }

  auto updated = cache_->UpdateAndGet(artist_id, patch);
  if (!updated) {
    observability::Metrics::Instance().RecordStatusWrite(false);
    result.error  = "stale update rejected: a newer version is cached";
    result.record = cache_->Get(artist_id);
    STAGESYNC_LOG_DEBUG("Status update rejected", {StringField("artist_id", artist_id)});
    return result;
  }

  queue::QueuedUpdate update;
  update.artist_id = artist_id;
  update.event_id  = event_id;
  update.updates   = model::PatchFrom(*updated);
  update.priority  = priority.value_or(queue::PriorityFor(updated->performance_status));

  result.accepted  = true;
  result.record    = *updated;
  result.update_id = queue_->Enqueue(std::move(update));

  observability::Metrics::Instance().RecordStatusWrite(true);
  Publish(*updated);
  return result;
}

std::vector<WriteResult> CacheManager::BatchUpdateStatuses(const std::vector<BatchItem>& items) {
  EnsureReady("BatchUpdateStatuses");

  std::vector<WriteResult> results;
  results.reserve(items.size());
  for (const auto& item : items) {
    try {
      results.push_back(UpdateArtistStatus(item.artist_id, item.updates, item.priority));
    } catch (const std::exception& e) {
      WriteResult failed;
      failed.artist_id = item.artist_id;
      failed.error     = e.what();
      results.push_back(std::move(failed));
    }
  }
  return results;
}

void CacheManager::Publish(const model::StatusRecord& record) {
  if (!channel_) return;

  stagesync::v1::StatusNotification notification;
  notification.set_origin_id(options_.origin_id);
  *notification.mutable_record() = store::ToDocument(record);

  try {
    channel_->Publish(notify::StatusTopic(record.event_id), store::ToJson(notification));
  } catch (const std::exception& e) {
    // The queued durable write still carries the change to other processes.
    STAGESYNC_LOG_WARN("Status notification failed", {StringField("artist_id", record.artist_id), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Inbound
// ------------------------------------------------------------

void CacheManager::HandleNotification(const std::string& payload) {
  try {
    stagesync::v1::StatusNotification notification;
    store::FromJson(payload, &notification);
    if (notification.origin_id() == options_.origin_id) return;

    ApplyRemoteStatus(store::FromDocument(notification.record()));
  } catch (const std::exception& e) {
    STAGESYNC_LOG_WARN("Dropped status notification", {StringField("error", e.what())});
  }
}

bool CacheManager::ApplyRemoteStatus(const model::StatusRecord& remote) {
  EnsureReady("ApplyRemoteStatus");
  if (remote.artist_id.empty() || remote.event_id != EventId()) return false;

  observability::SpanScope span("CacheManager.ApplyRemoteStatus");
  span.SetAttribute("artist_id", remote.artist_id);

  auto local = cache_->Get(remote.artist_id);
  if (!local) {
    auto record  = remote;
    record.dirty = false;
    cache_->Set(remote.artist_id, std::move(record));
    return true;
  }

  auto resolution = conflict::ConflictResolver::Resolve(*local, remote, options_.resolve);
  const bool remote_wins = resolution.winner == conflict::Winner::kRemote;

  if (!resolution.conflicts.empty()) {
    STAGESYNC_LOG_INFO("Inbound status conflict", {StringField("artist_id", remote.artist_id), BoolField("remote_wins", remote_wins),
                                                   StringField("detail", conflict::ConflictResolver::DescribeConflict(resolution))});
    RecordConflict(*local, remote, resolution);
  }

  if (!remote_wins) return false;
  return AdoptRecord(*local, remote);
}

bool CacheManager::AdoptRecord(const model::StatusRecord& local, const model::StatusRecord& winner) {
  // The local write lost; its pending durable write must not resurrect it.
  DropPendingWrites(winner.artist_id);

  auto patch      = model::PatchFrom(winner);
  // A timestamp win may carry an older version; never move the cached version back.
  patch.version   = std::max(winner.version, local.version);
  patch.timestamp = winner.timestamp;
  if (!cache_->Update(winner.artist_id, patch)) {
    // A newer local write landed after the comparison; it wins.
    if (cache_->Has(winner.artist_id)) return false;
    auto record    = winner;
    record.version = *patch.version;
    cache_->Set(winner.artist_id, std::move(record));
  }
  cache_->MarkCleanIfNotNewer(winner.artist_id, *patch.version);
  return true;
}

// ------------------------------------------------------------
// Persisted writes
// ------------------------------------------------------------

bool CacheManager::SettlePersisted(const model::StatusPatch& written, const model::StatusRecord& stored) {
  {
    std::lock_guard lock(context_mutex_);
    last_sync_time_ = clock_->Now();
  }

  auto attempted = stored;
  model::ApplyFields(attempted, written);

  // The store keeps a newer version over an older patch without writing it.
  const bool refused = written.version && stored.version > *written.version && !model::SameTrackedFields(attempted, stored);
  if (!refused) {
    cache_->MarkCleanIfNotNewer(stored.artist_id, stored.version);
    return true;
  }

  auto cached = cache_->Get(stored.artist_id);
  // A newer local write is already queued and meets the stored record itself.
  if (cached && cached->version > *written.version) return false;

  model::StatusRecord local = attempted;
  if (cached) {
    local = *cached;
  } else {
    local.version   = *written.version;
    local.timestamp = written.timestamp.value_or(stored.timestamp);
  }

  const auto resolution  = conflict::ConflictResolver::Resolve(local, stored, options_.resolve);
  const bool stored_wins = resolution.winner == conflict::Winner::kRemote;
  STAGESYNC_LOG_WARN("Durable store refused an older status write",
                     {StringField("artist_id", stored.artist_id), IntField("written_version", static_cast<std::int64_t>(*written.version)),
                      IntField("stored_version", static_cast<std::int64_t>(stored.version)), BoolField("stored_wins", stored_wins),
                      StringField("detail", conflict::ConflictResolver::DescribeConflict(resolution))});
  RecordConflict(local, stored, resolution);

  // A newer local write that lands meanwhile is still queued and decides instead.
  if (stored_wins) return AdoptRecord(local, stored);

  // The local record wins: rewrite it at the stored version so the store accepts it.
  model::StatusPatch bump;
  bump.version   = stored.version;
  bump.timestamp = local.timestamp;
  std::optional<model::StatusRecord> rewritten;
  if (cached) {
    rewritten = cache_->UpdateAndGet(stored.artist_id, bump);
  } else {
    local.version = stored.version;
    local.dirty   = true;
    cache_->Set(stored.artist_id, local);
    rewritten = local;
  }
  if (!rewritten) return false;

  queue::QueuedUpdate update;
  update.artist_id = rewritten->artist_id;
  update.event_id  = rewritten->event_id;
  update.updates   = model::PatchFrom(*rewritten);
  update.priority  = queue::PriorityFor(rewritten->performance_status);
  queue_->Enqueue(std::move(update));
  return false;
}

void CacheManager::DropPendingWrites(const std::string& artist_id) {
  for (const auto& pending : queue_->GetAllUpdates()) {
    if (pending.artist_id == artist_id) queue_->Remove(pending.id);
  }
}

void CacheManager::RecordConflict(const model::StatusRecord& local, const model::StatusRecord& remote, const conflict::Resolution& resolution) {
  ConflictNotice notice;
  notice.id             = util::NewId("conflict");
  notice.event_id       = remote.event_id;
  notice.artist_id      = remote.artist_id;
  notice.local_value    = local;
  notice.remote_value   = remote;
  notice.resolved_value = resolution.resolved;
  notice.strategy       = resolution.strategy;
  notice.conflicts      = resolution.conflicts;
  notice.timestamp      = clock_->Now();

  std::vector<ConflictListener> listeners;
  {
    std::lock_guard lock(context_mutex_);
    conflicts_.push_back(notice);
    while (conflicts_.size() > options_.conflict_history_limit) conflicts_.pop_front();
    listeners = conflict_listeners_;
  }
  for (const auto& listener : listeners) listener(notice);
}

// ------------------------------------------------------------
// Storage
// ------------------------------------------------------------

std::size_t CacheManager::FullSyncFromStorage(const std::string& event_id, const std::optional<std::string>& performance_date) {
  EnsureReady("FullSyncFromStorage");
  EnsureEvent(event_id);

  observability::SpanScope span("CacheManager.FullSyncFromStorage");
  ++total_operations_;

  cache_->Clear();
  const auto loaded = LoadFromStorage(event_id, performance_date);
  {
    std::lock_guard lock(context_mutex_);
    last_sync_time_ = clock_->Now();
  }
  STAGESYNC_LOG_INFO("Cache reloaded from storage", {StringField("event_id", event_id), IntField("loaded", static_cast<std::int64_t>(loaded))});
  return loaded;
}

bool CacheManager::SyncToStorage(const std::string& event_id, const std::optional<std::string>& performance_date) {
  EnsureReady("SyncToStorage");
  EnsureEvent(event_id);

  observability::SpanScope span("CacheManager.SyncToStorage");
  ++total_operations_;

  const auto  dirty     = cache_->GetDirtyEntries();
  bool        ok        = true;
  std::size_t persisted = 0;
  for (const auto& record : dirty) {
    if (PersistRecord(record)) {
      ++persisted;
    } else {
      ok = false;
    }
  }

  if (!ok) span.RecordException("one or more dirty entries were not persisted");
  STAGESYNC_LOG_INFO("Dirty entries synced to storage", {StringField("event_id", event_id), StringField("performance_date", performance_date.value_or("")),
                                                         IntField("dirty", static_cast<std::int64_t>(dirty.size())),
                                                         IntField("persisted", static_cast<std::int64_t>(persisted)), BoolField("success", ok)});
  return ok;
}

bool CacheManager::PersistRecord(const model::StatusRecord& record) {
  try {
    const auto written        = model::PatchFrom(record);
    const auto durable_record = durable_->MergePatch(record.event_id, record.artist_id, written);
    return SettlePersisted(written, durable_record);
  } catch (const std::exception& e) {
    ++sync_errors_;
    STAGESYNC_LOG_WARN("Persist failed", {StringField("artist_id", record.artist_id), StringField("error", e.what())});
    return false;
  }
}

bool CacheManager::MarkClean(const std::string& artist_id) {
  return cache_->MarkClean(artist_id);
}

std::vector<model::StatusRecord> CacheManager::GetDirtyEntries() const {
  return cache_->GetDirtyEntries();
}

std::string CacheManager::RequeueUpdate(queue::QueuedUpdate update) {
  EnsureReady("RequeueUpdate");
  if (update.event_id.empty()) update.event_id = EventId();
  update.retry_count = 0;
  update.next_retry_at.reset();
  update.last_error.clear();
  return queue_->Enqueue(std::move(update));
}

queue::ProcessReport CacheManager::ProcessQueue() {
  EnsureReady("ProcessQueue");
  return queue_->Process();
}

std::size_t CacheManager::RunCleanup() {
  EnsureReady("RunCleanup");
  return cache_->Cleanup();
}

// ------------------------------------------------------------
// Stats and listeners
// ------------------------------------------------------------

ManagerStats CacheManager::GetStats() const {
  ManagerStats stats;
  stats.cache            = cache_->GetStats();
  stats.queue            = queue_->GetStats();
  stats.sync_errors      = sync_errors_;
  stats.total_operations = total_operations_;
  stats.state            = state_;

  std::lock_guard lock(context_mutex_);
  stats.last_sync_time = last_sync_time_;
  stats.conflicts      = conflicts_.size();
  return stats;
}

std::vector<ConflictNotice> CacheManager::GetConflicts() const {
  std::lock_guard lock(context_mutex_);
  return {conflicts_.begin(), conflicts_.end()};
}

void CacheManager::OnConflict(ConflictListener listener) {
  std::lock_guard lock(context_mutex_);
  conflict_listeners_.push_back(std::move(listener));
}

void CacheManager::OnTerminalFailure(FailureListener listener) {
  std::lock_guard lock(context_mutex_);
  failure_listeners_.push_back(std::move(listener));
}

} // namespace stagesync::core
