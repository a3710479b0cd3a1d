#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/cache/status_cache.hpp"
#include "internal/conflict/conflict_resolver.hpp"
#include "internal/notify/change_channel.hpp"
#include "internal/queue/update_queue.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/store/status_repository.hpp"

namespace stagesync::core {

enum class ManagerState {
  kUninitialized,
  kInitializing,
  kReady,
  kDestroyed,
};

std::string_view ToString(ManagerState state);

struct CacheManagerOptions {
  // Identifies this process on the change channel; generated when empty.
  std::string               origin_id;
  conflict::ResolveOptions  resolve{};
  std::chrono::milliseconds drain_interval{2000};
  std::chrono::milliseconds cleanup_interval{std::chrono::minutes(5)};
  bool                      start_background_tasks = true;
  std::size_t               conflict_history_limit = 100;
};

struct WriteResult {
  std::string                        artist_id;
  bool                               accepted = false;
  std::optional<model::StatusRecord> record;
  std::string                        update_id;
  std::string                        error;
};

struct BatchItem {
  std::string                          artist_id;
  model::StatusPatch                   updates;
  std::optional<queue::UpdatePriority> priority;
};

/*
  A conflict found while applying an inbound notification.
*/
struct ConflictNotice {
  std::string              id;
  std::string              event_id;
  std::string              artist_id;
  model::StatusRecord      local_value;
  model::StatusRecord      remote_value;
  model::StatusRecord      resolved_value;
  conflict::Strategy       strategy = conflict::Strategy::kTimestamp;
  std::vector<std::string> conflicts;
  util::TimePoint          timestamp{};
};

struct ManagerStats {
  cache::CacheStats              cache;
  queue::QueueStats              queue;
  std::uint64_t                  sync_errors      = 0;
  std::uint64_t                  total_operations = 0;
  std::optional<util::TimePoint> last_sync_time;
  std::size_t                    conflicts = 0;
  ManagerState                   state     = ManagerState::kUninitialized;
};

/*
  CacheManager

  The single entry point for status reads and writes of one event.

  Write path: optimistic cache update (dirty) -> queued durable write ->
  change notification. The queue's persisted callback clears dirty unless the
  cached record has moved on in the meantime. When the durable store already
  held a newer, different record, the write was refused: the two are
  resolved last-writer-wins and reported as a conflict. The cache adopts a
  winning stored record; a winning local record is requeued at the stored
  version.

  Read path: cache first, read-through from the durable store on a miss.

  Inbound notifications are resolved last-writer-wins against the cache.

  Lifecycle: uninitialized -> initializing -> ready -> destroyed, and ready
  again after a new Initialize. Every operation other than Initialize,
  Destroy and the accessors throws util::InvalidState unless ready.
*/
class CacheManager {
 public:
  using ConflictListener = std::function<void(const ConflictNotice&)>;
  using FailureListener  = queue::UpdateQueue::FailureListener;

  CacheManager(std::shared_ptr<cache::StatusCache> cache, std::shared_ptr<queue::UpdateQueue> queue, std::shared_ptr<store::StatusRepository> durable,
               std::shared_ptr<notify::ChangeChannel> channel, CacheManagerOptions options = {},
               std::shared_ptr<util::Clock> clock = std::make_shared<util::SystemClock>());
  ~CacheManager();

  CacheManager(const CacheManager&)            = delete;
  CacheManager& operator=(const CacheManager&) = delete;

  // No-op when already ready for event_id; a different event must Destroy first.
  void Initialize(const std::string& event_id, const std::optional<std::string>& performance_date = std::nullopt);
  void Destroy();

  std::optional<model::StatusRecord> GetArtistStatus(const std::string& artist_id);

  // Priority defaults to PriorityFor(resulting status).
  WriteResult              UpdateArtistStatus(const std::string& artist_id, const model::StatusPatch& patch,
                                              std::optional<queue::UpdatePriority> priority = std::nullopt);
  std::vector<WriteResult> BatchUpdateStatuses(const std::vector<BatchItem>& items);

  // Returns true when the remote record replaced or seeded the cached one.
  bool ApplyRemoteStatus(const model::StatusRecord& remote);

  // Clears the cache and reloads the event; returns the number of records loaded.
  std::size_t FullSyncFromStorage(const std::string& event_id, const std::optional<std::string>& performance_date);

  // Writes every dirty entry to the durable store now. False when any write failed.
  bool SyncToStorage(const std::string& event_id, const std::optional<std::string>& performance_date);

  // True when the durable store now holds the record or a winning newer one.
  bool                             PersistRecord(const model::StatusRecord& record);
  bool                             MarkClean(const std::string& artist_id);
  std::vector<model::StatusRecord> GetDirtyEntries() const;
  std::string                      RequeueUpdate(queue::QueuedUpdate update);
  queue::ProcessReport             ProcessQueue();
  std::size_t                      RunCleanup();

  ManagerStats                GetStats() const;
  std::vector<ConflictNotice> GetConflicts() const;

  void OnConflict(ConflictListener listener);
  void OnTerminalFailure(FailureListener listener);

  ManagerState State() const {
    return state_;
  }
  std::string EventId() const;
  const std::string& OriginId() const {
    return options_.origin_id;
  }

 private:
  void        EnsureReady(std::string_view operation) const;
  void        EnsureEvent(const std::string& event_id) const;
  std::size_t LoadFromStorage(const std::string& event_id, const std::optional<std::string>& performance_date);
  void        Publish(const model::StatusRecord& record);
  void        HandleNotification(const std::string& payload);
  void        RecordConflict(const model::StatusRecord& local, const model::StatusRecord& remote, const conflict::Resolution& resolution);
  bool        AdoptRecord(const model::StatusRecord& local, const model::StatusRecord& winner);
  bool        SettlePersisted(const model::StatusPatch& written, const model::StatusRecord& stored);
  void        DropPendingWrites(const std::string& artist_id);
  void        StartTasks();
  void        StopTasks();

  std::shared_ptr<cache::StatusCache>      cache_;
  std::shared_ptr<queue::UpdateQueue>      queue_;
  std::shared_ptr<store::StatusRepository> durable_;
  std::shared_ptr<notify::ChangeChannel>   channel_;
  CacheManagerOptions                      options_;
  std::shared_ptr<util::Clock>             clock_;

  // Serializes Initialize/Destroy.
  std::mutex                lifecycle_mutex_;
  std::atomic<ManagerState> state_{ManagerState::kUninitialized};

  mutable std::mutex                                   context_mutex_;
  std::string                                          event_id_;
  std::optional<std::string>                           performance_date_;
  std::optional<util::TimePoint>                       last_sync_time_;
  std::deque<ConflictNotice>                           conflicts_;
  std::vector<ConflictListener>                        conflict_listeners_;
  std::vector<FailureListener>                         failure_listeners_;
  std::optional<notify::ChangeChannel::SubscriptionId> subscription_;

  std::atomic<std::uint64_t> sync_errors_{0};
  std::atomic<std::uint64_t> total_operations_{0};

  std::unique_ptr<runtime::PeriodicTask> drain_task_;
  std::unique_ptr<runtime::PeriodicTask> cleanup_task_;

  // Cleared on destruction; queue callbacks check it before touching the manager.
  std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace stagesync::core
