#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/status_cache.hpp"
#include "internal/core/cache_manager.hpp"
#include "internal/notify/change_channel.hpp"
#include "internal/queue/update_queue.hpp"
#include "internal/recovery/recovery_service.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/store/status_repository.hpp"
#include "internal/sync/sync_service.hpp"

namespace stagesync::factory {

/*
  Engine

  Every long-lived component of one process. Members are declared in
  dependency order so the periodic sync stops before anything it uses is
  torn down.
*/
struct Engine {
  std::shared_ptr<store::StatusRepository> local;
  std::shared_ptr<store::StatusRepository> cloud;
  std::shared_ptr<notify::ChangeChannel>   channel;

  std::shared_ptr<cache::StatusCache>        cache;
  std::shared_ptr<queue::UpdateQueue>        queue;
  std::shared_ptr<core::CacheManager>        manager;
  std::shared_ptr<sync::SyncService>         sync;
  std::shared_ptr<recovery::RecoveryService> recovery;

  std::unique_ptr<runtime::PeriodicTask> sync_task;
};

/*
  BuildEngine

  Composition root: the only place that knows concrete store types.
  Initializes the cache manager when the config names an event and starts
  the periodic sync when enabled.
*/
Engine BuildEngine(const stagesync::runtime::config::RuntimeConfig& config);

} // namespace stagesync::factory
