#include "factory.hpp"

#include "internal/config/runtime_options.hpp"
#include "internal/core/durable_status_writer.hpp"
#include "internal/notify/local_change_channel.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/queue_journal.hpp"
#include "internal/recovery/health_probe.hpp"
#include "internal/store/store_factory.hpp"

namespace stagesync::factory {

using observability::BoolField;
using observability::StringField;

Engine BuildEngine(const stagesync::runtime::config::RuntimeConfig& config) {
  Engine engine;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  auto local_store = store::StoreFactory::Build(config.storage().local());
  auto cloud_store = store::StoreFactory::Build(config.storage().cloud());

  engine.local   = std::make_shared<store::StatusRepository>(local_store);
  engine.cloud   = std::make_shared<store::StatusRepository>(cloud_store);
  engine.channel = std::make_shared<notify::LocalChangeChannel>();

  STAGESYNC_LOG_INFO("Stores ready", {StringField("local", local_store->Name()), StringField("cloud", cloud_store->Name())});

  // ------------------------------------------------------------------
  // Cache and write-behind queue
  // ------------------------------------------------------------------
  engine.cache = std::make_shared<cache::StatusCache>(config::ToCacheOptions(config.cache()));

  std::shared_ptr<queue::QueueJournal> journal;
  if (config.queue().journal_enabled()) {
    journal = std::make_shared<queue::QueueJournal>(local_store);
  }
  auto writer  = std::make_shared<core::DurableStatusWriter>(engine.cloud);
  engine.queue = std::make_shared<queue::UpdateQueue>(config::ToQueueOptions(config.queue()), writer,
                                                      std::make_shared<util::SystemClock>(), journal);

  engine.manager = std::make_shared<core::CacheManager>(engine.cache, engine.queue, engine.cloud, engine.channel, config::ToManagerOptions(config));

  // ------------------------------------------------------------------
  // Sync and recovery
  // ------------------------------------------------------------------
  engine.sync = std::make_shared<sync::SyncService>(engine.local, engine.cloud, config::ToSyncOptions(config.sync()));

  auto probe      = std::make_shared<recovery::StoreHealthProbe>(cloud_store);
  engine.recovery = std::make_shared<recovery::RecoveryService>(engine.manager, engine.cloud, probe, config::ToRecoveryOptions(config.recovery()));

  // ------------------------------------------------------------------
  // Startup
  // ------------------------------------------------------------------
  const auto& event = config.event();
  if (!event.event_id().empty()) {
    std::optional<std::string> performance_date;
    if (!event.performance_date().empty()) performance_date = event.performance_date();
    engine.manager->Initialize(event.event_id(), performance_date);
  }

  if (config.sync().enabled()) {
    auto sync        = engine.sync;
    engine.sync_task = std::make_unique<runtime::PeriodicTask>("sync", config::SyncInterval(config.sync()), [sync] { sync->SyncData(); });
    engine.sync_task->Start();
  }

  STAGESYNC_LOG_INFO("Engine built", {StringField("event_id", event.event_id()), BoolField("sync_enabled", config.sync().enabled()),
                                      BoolField("journal_enabled", config.queue().journal_enabled())});
  return engine;
}

} // namespace stagesync::factory
