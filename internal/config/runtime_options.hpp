#pragma once

#include <chrono>

#include "config/config.pb.h"
#include "internal/cache/status_cache.hpp"
#include "internal/conflict/conflict_resolver.hpp"
#include "internal/core/cache_manager.hpp"
#include "internal/queue/update_queue.hpp"
#include "internal/recovery/recovery_service.hpp"
#include "internal/sync/sync_service.hpp"

namespace stagesync::config {

/*
  Config message -> component options. Unset or zero values take the
  component defaults.
*/

cache::CacheOptions       ToCacheOptions(const stagesync::runtime::config::CacheConfig& config);
queue::QueueOptions       ToQueueOptions(const stagesync::runtime::config::QueueConfig& config);
conflict::ResolveOptions  ToResolveOptions(const stagesync::runtime::config::ConflictConfig& config);
sync::SyncOptions         ToSyncOptions(const stagesync::runtime::config::SyncConfig& config);
recovery::RecoveryOptions ToRecoveryOptions(const stagesync::runtime::config::RecoveryConfig& config);
core::CacheManagerOptions ToManagerOptions(const stagesync::runtime::config::RuntimeConfig& config);

// Default 5 minutes.
std::chrono::milliseconds SyncInterval(const stagesync::runtime::config::SyncConfig& config);

} // namespace stagesync::config
