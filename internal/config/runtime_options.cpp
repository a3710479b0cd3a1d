#include "internal/config/runtime_options.hpp"

#include "internal/util/time.hpp"

namespace stagesync::config {

using namespace std::chrono_literals;
namespace cfg = stagesync::runtime::config;

cache::CacheOptions ToCacheOptions(const cfg::CacheConfig& config) {
  cache::CacheOptions options;
  options.ttl = util::ToMillis(config.ttl(), options.ttl);
  if (config.max_entries() > 0) options.max_entries = config.max_entries();
  return options;
}

queue::QueueOptions ToQueueOptions(const cfg::QueueConfig& config) {
  queue::QueueOptions options;
  // max_retries is optional so that an explicit 0 (fail on first error) survives
  if (config.has_max_retries()) options.max_retries = config.max_retries();
  if (config.batch_size() > 0) options.batch_size = config.batch_size();
  options.retry_delay     = util::ToMillis(config.retry_delay(), options.retry_delay);
  options.max_retry_delay = util::ToMillis(config.max_retry_delay(), options.max_retry_delay);
  if (options.max_retry_delay < options.retry_delay) options.max_retry_delay = options.retry_delay;
  return options;
}

conflict::ResolveOptions ToResolveOptions(const cfg::ConflictConfig& config) {
  conflict::ResolveOptions options;
  options.skew = util::ToMillis(config.status_skew(), options.skew);
  return options;
}

sync::SyncOptions ToSyncOptions(const cfg::SyncConfig& config) {
  sync::SyncOptions options;
  options.detection_skew = util::ToMillis(config.detection_skew(), options.detection_skew);
  return options;
}

recovery::RecoveryOptions ToRecoveryOptions(const cfg::RecoveryConfig& config) {
  recovery::RecoveryOptions options;
  options.connectivity_timeout = util::ToMillis(config.connectivity_timeout(), options.connectivity_timeout);
  options.poll_interval        = util::ToMillis(config.poll_interval(), options.poll_interval);
  if (config.history_limit() > 0) options.history_limit = config.history_limit();
  if (config.has_max_retries()) options.max_retries = config.max_retries();
  return options;
}

core::CacheManagerOptions ToManagerOptions(const cfg::RuntimeConfig& config) {
  core::CacheManagerOptions options;
  options.resolve          = ToResolveOptions(config.conflict());
  options.drain_interval   = util::ToMillis(config.queue().drain_interval(), options.drain_interval);
  options.cleanup_interval = util::ToMillis(config.cache().cleanup_interval(), options.cleanup_interval);
  return options;
}

std::chrono::milliseconds SyncInterval(const cfg::SyncConfig& config) {
  return util::ToMillis(config.interval(), 5min);
}

} // namespace stagesync::config
