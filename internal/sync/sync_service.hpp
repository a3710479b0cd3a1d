#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/store/status_repository.hpp"
#include "internal/sync/sync_types.hpp"

namespace stagesync::sync {

struct SyncOptions {
  // Timestamps further apart than this count as a conflict.
  std::chrono::milliseconds detection_skew{std::chrono::seconds(60)};
};

/*
  SyncService

  Reconciles the fast local store with the durable cloud store, independently
  of any cache. Entity classes:
    - status records, keyed eventId/artistId, resolved last-writer-wins
    - monotonic counters, reconciled to max(local, remote)

  Only one run at a time; a concurrent call throws util::SyncInProgress.
  Failures inside an entity class are reported in SyncResult::errors and do
  not roll back what was already copied.
*/
class SyncService {
 public:
  SyncService(std::shared_ptr<store::StatusRepository> local, std::shared_ptr<store::StatusRepository> remote, SyncOptions options = {},
              std::shared_ptr<util::Clock> clock = std::make_shared<util::SystemClock>());

  SyncResult SyncData();
  SyncResult SyncFromRemoteToLocal();
  SyncResult SyncFromLocalToRemote();

  std::optional<SyncMetadata> GetLastSyncMetadata();

  bool IsSyncing() const {
    return syncing_;
  }

  static constexpr const char* kMetadataKey = "sync/metadata.json";

 private:
  SyncResult Run(SyncDirection direction);

  void ReconcileStatuses(SyncResult& result, std::uint64_t& total_items);
  void ReconcileCounters(SyncResult& result, std::uint64_t& total_items);
  void CopyStatuses(store::StatusRepository& from, store::StatusRepository& to, SyncResult& result, std::uint64_t& total_items);
  void CopyCounters(store::StatusRepository& from, store::StatusRepository& to, SyncResult& result, std::uint64_t& total_items);

  void SaveMetadata(const SyncMetadata& metadata);

  std::shared_ptr<store::StatusRepository> local_;
  std::shared_ptr<store::StatusRepository> remote_;
  SyncOptions                              options_;
  std::shared_ptr<util::Clock>             clock_;

  std::atomic<bool> syncing_{false};
};

} // namespace stagesync::sync
