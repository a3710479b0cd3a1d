#include "internal/service/status_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/cache_manager.hpp"
#include "internal/core/durable_status_writer.hpp"
#include "internal/notify/local_change_channel.hpp"
#include "internal/recovery/recovery_service.hpp"
#include "internal/store/memory_document_store.hpp"
#include "internal/sync/sync_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace stagesync::v1;

struct Engine {
  Engine() {
    auto cache = std::make_shared<stagesync::cache::StatusCache>(stagesync::cache::CacheOptions{}, clock);
    queue      = std::make_shared<stagesync::queue::UpdateQueue>(stagesync::queue::QueueOptions{},
                                                                 std::make_shared<stagesync::core::DurableStatusWriter>(remote), clock);

    stagesync::core::CacheManagerOptions options;
    options.start_background_tasks = false;
    manager = std::make_shared<stagesync::core::CacheManager>(cache, queue, remote, std::make_shared<stagesync::notify::LocalChangeChannel>(),
                                                              options, clock);
    manager->Initialize("fest");

    stagesync::recovery::RecoveryOptions recovery_options;
    recovery_options.poll_interval = std::chrono::milliseconds(1);
    recovery_options.max_retries   = 0;

    ctx.manager  = manager;
    ctx.sync     = std::make_shared<stagesync::sync::SyncService>(local, remote, stagesync::sync::SyncOptions{}, clock);
    ctx.recovery = std::make_shared<stagesync::recovery::RecoveryService>(
        manager, remote, std::make_shared<stagesync::recovery::StoreHealthProbe>(remote_store), recovery_options, clock);
  }

  std::shared_ptr<stagesync::util::ManualClock>          clock        = std::make_shared<stagesync::util::ManualClock>();
  std::shared_ptr<stagesync::store::MemoryDocumentStore> local_store  = std::make_shared<stagesync::store::MemoryDocumentStore>("local");
  std::shared_ptr<stagesync::store::MemoryDocumentStore> remote_store = std::make_shared<stagesync::store::MemoryDocumentStore>("cloud");
  std::shared_ptr<stagesync::store::StatusRepository>    local        = std::make_shared<stagesync::store::StatusRepository>(local_store);
  std::shared_ptr<stagesync::store::StatusRepository>    remote       = std::make_shared<stagesync::store::StatusRepository>(remote_store);
  std::shared_ptr<stagesync::queue::UpdateQueue>         queue;
  std::shared_ptr<stagesync::core::CacheManager>         manager;
  stagesync::service::ServiceContext                     ctx;
};

UpdateArtistStatusRequest Update(const std::string& artist_id, const std::string& status, UpdatePriority priority = UPDATE_PRIORITY_UNSPECIFIED) {
  UpdateArtistStatusRequest req;
  req.set_artist_id(artist_id);
  req.mutable_updates()->set_performance_status(status);
  req.set_priority(priority);
  return req;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestUpdateThenGet() {
  Engine engine;
  stagesync::service::StatusService service(engine.ctx);

  const auto resp = service.UpdateArtistStatus(Update("a", "currently_on_stage"));
  assert(resp.accepted());
  assert(resp.artist_id() == "a");
  assert(!resp.update_id().empty());
  assert(resp.record().performance_status() == "currently_on_stage");
  assert(resp.record().version() == 1);
  assert(resp.record().dirty());

  GetArtistStatusRequest get;
  get.set_artist_id("a");
  const auto found = service.GetArtistStatus(get);
  assert(found.found());
  assert(found.record().performance_status() == "currently_on_stage");

  get.set_artist_id("nobody");
  assert(!service.GetArtistStatus(get).found());
}

void TestPriorityMapping() {
  Engine engine;
  stagesync::service::StatusService service(engine.ctx);

  service.UpdateArtistStatus(Update("a", "completed", UPDATE_PRIORITY_HIGH));
  service.UpdateArtistStatus(Update("b", "completed"));
  const auto pending = engine.queue->GetAllUpdates();
  assert(pending[0].artist_id == "a");
  assert(pending[0].priority == stagesync::queue::UpdatePriority::kHigh);
  assert(pending[1].priority == stagesync::queue::UpdatePriority::kNormal);
}

void TestValidation() {
  Engine engine;
  stagesync::service::StatusService service(engine.ctx);

  assert(Throws<stagesync::util::InvalidArgument>([&] { service.GetArtistStatus(GetArtistStatusRequest{}); }));
  assert(Throws<stagesync::util::InvalidArgument>([&] { service.UpdateArtistStatus(Update("", "completed")); }));
  assert(Throws<stagesync::util::InvalidArgument>([&] { service.UpdateArtistStatus(Update("a", "encore")); }));

  RecoverRequest recover;
  recover.set_type("disk_failure");
  assert(Throws<stagesync::util::InvalidArgument>([&] { service.Recover(recover); }));

  engine.manager->Destroy();
  GetArtistStatusRequest get;
  get.set_artist_id("a");
  assert(Throws<stagesync::util::InvalidState>([&] { service.GetArtistStatus(get); }));
}

void TestBatchKeepsGoingPastBadItems() {
  Engine engine;
  stagesync::service::StatusService service(engine.ctx);

  BatchUpdateStatusesRequest req;
  *req.add_items() = Update("a", "next_on_deck");
  *req.add_items() = Update("", "next_on_deck");
  *req.add_items() = Update("b", "next_on_stage");

  const auto resp = service.BatchUpdateStatuses(req);
  assert(resp.results_size() == 3);
  assert(resp.results(0).accepted());
  assert(!resp.results(1).accepted());
  assert(!resp.results(1).error().empty());
  assert(resp.results(2).accepted());
}

void TestSyncDataCopiesBetweenStores() {
  Engine engine;
  stagesync::service::StatusService service(engine.ctx);

  service.UpdateArtistStatus(Update("a", "completed"));
  engine.manager->ProcessQueue();

  SyncDataRequest req;
  req.set_direction(SYNC_DIRECTION_REMOTE_TO_LOCAL);
  const auto resp = service.SyncData(req);
  assert(resp.success());
  assert(resp.items_synced() >= 1);
  assert(resp.errors_size() == 0);
  assert(resp.metadata().sync_direction() == "remote-to-local");
  assert(engine.local->GetStatus("fest", "a").has_value());
}

void TestSyncDataReportsUnavailableRemote() {
  Engine engine;
  stagesync::service::StatusService service(engine.ctx);
  engine.remote_store->SetAvailable(false);

  const auto resp = service.SyncData(SyncDataRequest{});
  assert(!resp.success());
  assert(resp.errors_size() == 1);
}

void TestRecoverDefaultsToManagedEvent() {
  Engine engine;
  stagesync::service::StatusService service(engine.ctx);
  service.UpdateArtistStatus(Update("a", "next_on_deck"));

  RecoverRequest req;
  req.set_type("sync_failure");
  assert(service.Recover(req).success());
  assert(engine.remote->GetStatus("fest", "a").has_value());

  req.set_type("cache_corruption");
  req.set_event_id("fest");
  assert(service.Recover(req).success());
}

void TestGetStats() {
  Engine engine;
  stagesync::service::StatusService service(engine.ctx);
  service.UpdateArtistStatus(Update("a", "next_on_deck"));
  service.UpdateArtistStatus(Update("b", "completed"));
  engine.manager->ProcessQueue();

  RecoverRequest recover;
  recover.set_type("sync_failure");
  service.Recover(recover);

  const auto stats = service.GetStats(GetStatsRequest{});
  assert(stats.cache_entries() == 2);
  assert(stats.cache_dirty_entries() == 0);
  assert(stats.queue_size() == 0);
  assert(stats.queue_completed() == 2);
  assert(stats.has_last_sync_time());
  assert(stats.state() == "ready");
  assert(stats.recoveries_total() == 1);
  assert(stats.recoveries_successful() == 1);
}

void TestMissingCollaborators() {
  Engine                             engine;
  stagesync::service::ServiceContext ctx;
  ctx.manager = engine.manager;
  stagesync::service::StatusService service(ctx);

  RecoverRequest recover;
  recover.set_type("sync_failure");
  assert(Throws<stagesync::util::InvalidState>([&] { service.SyncData(SyncDataRequest{}); }));
  assert(Throws<stagesync::util::InvalidState>([&] { service.Recover(recover); }));
  assert(service.GetStats(GetStatsRequest{}).recoveries_total() == 0);
}

} // namespace

int main() {
  TestUpdateThenGet();
  TestPriorityMapping();
  TestValidation();
  TestBatchKeepsGoingPastBadItems();
  TestSyncDataCopiesBetweenStores();
  TestSyncDataReportsUnavailableRemote();
  TestRecoverDefaultsToManagedEvent();
  TestGetStats();
  TestMissingCollaborators();

  std::cout << "stagesync_unit_status_service: pass\n";
  return 0;
}
