#include "internal/recovery/recovery_service.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace stagesync::recovery {

using observability::IntField;
using observability::StringField;

std::string_view ToString(RecoveryType type) {
  switch (type) {
    case RecoveryType::kCacheCorruption:
      return "cache_corruption";
    case RecoveryType::kNetworkFailure:
      return "network_failure";
    case RecoveryType::kDataInconsistency:
      return "data_inconsistency";
    case RecoveryType::kSyncFailure:
      return "sync_failure";
  }
  return "cache_corruption";
}

std::string_view ToString(OperationStatus status) {
  switch (status) {
    case OperationStatus::kPending:
      return "pending";
    case OperationStatus::kInProgress:
      return "in_progress";
    case OperationStatus::kCompleted:
      return "completed";
    case OperationStatus::kFailed:
      return "failed";
  }
  return "pending";
}

std::optional<RecoveryType> ParseRecoveryType(std::string_view text) {
  if (text == "cache_corruption") return RecoveryType::kCacheCorruption;
  if (text == "network_failure") return RecoveryType::kNetworkFailure;
  if (text == "data_inconsistency") return RecoveryType::kDataInconsistency;
  if (text == "sync_failure") return RecoveryType::kSyncFailure;
  return std::nullopt;
}

namespace {

class RecoveryGuard {
 public:
  explicit RecoveryGuard(std::atomic<bool>& flag) : flag_(flag) {
  }
  ~RecoveryGuard() {
    flag_ = false;
  }

  RecoveryGuard(const RecoveryGuard&)            = delete;
  RecoveryGuard& operator=(const RecoveryGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

} // namespace

RecoveryService::RecoveryService(std::shared_ptr<core::CacheManager> manager, std::shared_ptr<store::StatusRepository> durable,
                                 std::shared_ptr<HealthProbe> probe, RecoveryOptions options, std::shared_ptr<util::Clock> clock)
    : manager_(std::move(manager)), durable_(std::move(durable)), probe_(std::move(probe)), options_(options), clock_(std::move(clock)) {
  if (!manager_ || !durable_ || !probe_) {
    throw std::invalid_argument("RecoveryService requires a cache manager, a durable repository and a health probe");
  }
}

// ------------------------------------------------------------
// Procedures
// ------------------------------------------------------------

bool RecoveryService::RecoverFromCacheCorruption(const std::string& event_id, const std::optional<std::string>& performance_date) {
  return Run(RecoveryType::kCacheCorruption, event_id, performance_date, [&](RecoveryOperation&) {
    manager_->Destroy();
    manager_->Initialize(event_id, performance_date);
    manager_->FullSyncFromStorage(event_id, performance_date);

    if (manager_->GetStats().cache.total_entries == 0) {
      throw std::runtime_error("cache still empty after recovery");
    }
  });
}

bool RecoveryService::RecoverFromNetworkFailure(const std::string& event_id, const std::optional<std::string>& performance_date,
                                                const std::vector<queue::QueuedUpdate>& failed_operations) {
  // Requeue once; retries of the procedure must not duplicate the updates.
  bool requeued = false;
  return Run(RecoveryType::kNetworkFailure, event_id, performance_date, [&](RecoveryOperation& operation) {
    WaitForConnectivity();

    if (!requeued) {
      for (const auto& update : failed_operations) {
        manager_->RequeueUpdate(update);
      }
      requeued = true;
    }

    operation.items_total = failed_operations.size();
    if (!manager_->SyncToStorage(event_id, performance_date)) {
      throw std::runtime_error("failed to sync cache after network recovery");
    }
    operation.items_recovered = failed_operations.size();
  });
}

bool RecoveryService::RecoverFromDataInconsistency(const std::string& event_id, const std::optional<std::string>& performance_date,
                                                   const std::vector<std::string>& artist_ids) {
  return Run(RecoveryType::kDataInconsistency, event_id, performance_date, [&](RecoveryOperation& operation) {
    if (artist_ids.empty()) {
      manager_->FullSyncFromStorage(event_id, performance_date);
      return;
    }

    operation.items_total     = artist_ids.size();
    operation.items_recovered = 0;
    for (const auto& artist_id : artist_ids) {
      auto durable = durable_->GetStatus(event_id, artist_id);
      if (durable) {
        manager_->ApplyRemoteStatus(*durable);
        ++operation.items_recovered;
        continue;
      }
      // Missing from the durable store: the cached copy is the only one left.
      if (auto cached = manager_->GetArtistStatus(artist_id)) {
        if (!manager_->PersistRecord(*cached)) {
          throw util::StoreUnavailable("could not persist cached status for artist " + artist_id);
        }
      }
      ++operation.items_recovered;
    }
  });
}

bool RecoveryService::RecoverFromSyncFailure(const std::string& event_id, const std::optional<std::string>& performance_date) {
  return Run(RecoveryType::kSyncFailure, event_id, performance_date, [&](RecoveryOperation& operation) {
    const auto dirty = manager_->GetDirtyEntries();
    if (dirty.empty()) return;

    std::size_t persisted = 0;
    for (const auto& record : dirty) {
      if (manager_->PersistRecord(record)) ++persisted;
    }
    operation.items_total     = dirty.size();
    operation.items_recovered = persisted;

    STAGESYNC_LOG_INFO("Sync failure recovery pass", {StringField("event_id", event_id), IntField("persisted", static_cast<std::int64_t>(persisted)),
                                                      IntField("dirty", static_cast<std::int64_t>(dirty.size()))});
    if (persisted == 0) {
      throw std::runtime_error("failed to persist any of " + std::to_string(dirty.size()) + " dirty entries");
    }
  });
}

bool RecoveryService::AutoRecover(RecoveryType type, const std::string& event_id, const std::optional<std::string>& performance_date,
                                  const RecoveryContext& context) {
  bool expected = false;
  if (!recovering_.compare_exchange_strong(expected, true)) {
    STAGESYNC_LOG_INFO("Recovery already in progress, skipping", {StringField("type", ToString(type))});
    return false;
  }
  RecoveryGuard guard(recovering_);

  switch (type) {
    case RecoveryType::kCacheCorruption:
      return RecoverFromCacheCorruption(event_id, performance_date);
    case RecoveryType::kNetworkFailure:
      return RecoverFromNetworkFailure(event_id, performance_date, context.failed_operations);
    case RecoveryType::kDataInconsistency:
      return RecoverFromDataInconsistency(event_id, performance_date, context.artist_ids);
    case RecoveryType::kSyncFailure:
      return RecoverFromSyncFailure(event_id, performance_date);
  }
  return false;
}

// ------------------------------------------------------------
// Operation tracking
// ------------------------------------------------------------

bool RecoveryService::Run(RecoveryType type, const std::string& event_id, const std::optional<std::string>& performance_date,
                          const std::function<void(RecoveryOperation&)>& procedure) {
  observability::SpanScope span("RecoveryService.Recover");
  span.SetAttribute("type", ToString(type));
  span.SetAttribute("event_id", event_id);

  RecoveryOperation operation;
  operation.id               = util::NewId("recovery");
  operation.type             = type;
  operation.event_id         = event_id;
  operation.performance_date = performance_date;
  operation.timestamp        = clock_->Now();
  operation.max_retries      = options_.max_retries;
  Report(operation);

  operation.status = OperationStatus::kInProgress;
  Report(operation);

  STAGESYNC_LOG_INFO("Recovery started", {StringField("operation_id", operation.id), StringField("type", ToString(type)),
                                          StringField("event_id", event_id)});

  while (true) {
    try {
      procedure(operation);
      operation.status = OperationStatus::kCompleted;
      operation.error.clear();
      break;
    } catch (const util::ConnectivityTimeout& e) {
      operation.status = OperationStatus::kFailed;
      operation.error  = e.what();
      break;
    } catch (const std::exception& e) {
      operation.error = e.what();
      if (operation.retry_count >= operation.max_retries) {
        operation.status = OperationStatus::kFailed;
        break;
      }
      ++operation.retry_count;
      STAGESYNC_LOG_WARN("Recovery attempt failed, retrying",
                         {StringField("operation_id", operation.id), IntField("retry", operation.retry_count), StringField("error", e.what())});
      Report(operation);
      std::this_thread::sleep_for(options_.poll_interval);
    }
  }

  operation.timestamp = clock_->Now();
  Report(operation);

  const bool success = operation.status == OperationStatus::kCompleted;
  observability::Metrics::Instance().RecordRecovery(ToString(type), success);
  if (success) {
    STAGESYNC_LOG_INFO("Recovery completed", {StringField("operation_id", operation.id), StringField("type", ToString(type)),
                                              IntField("retries", operation.retry_count)});
  } else {
    span.RecordException(operation.error);
    STAGESYNC_LOG_ERROR("Recovery failed", {StringField("operation_id", operation.id), StringField("type", ToString(type)),
                                            IntField("retries", operation.retry_count), StringField("error", operation.error)});
  }
  return success;
}

void RecoveryService::WaitForConnectivity() {
  const auto deadline = std::chrono::steady_clock::now() + options_.connectivity_timeout;
  while (!probe_->Check()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw util::ConnectivityTimeout("durable store unreachable after " + std::to_string(options_.connectivity_timeout.count()) + "ms");
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(options_.poll_interval, remaining));
  }
}

void RecoveryService::Report(const RecoveryOperation& operation) {
  std::vector<OperationListener> listeners;
  {
    std::lock_guard lock(mutex_);

    auto it = std::find_if(history_.begin(), history_.end(), [&](const RecoveryOperation& op) { return op.id == operation.id; });
    if (it == history_.end()) {
      history_.push_back(operation);
      ++stats_.total_operations;
      while (history_.size() > options_.history_limit) history_.pop_front();
    } else {
      *it = operation;
    }

    if (operation.status == OperationStatus::kCompleted) {
      ++stats_.successful_recoveries;
      stats_.last_recovery_time = operation.timestamp;
    } else if (operation.status == OperationStatus::kFailed) {
      ++stats_.failed_recoveries;
      stats_.last_recovery_time = operation.timestamp;
    }
    listeners = listeners_;
  }

  for (const auto& listener : listeners) listener(operation);
}

std::vector<RecoveryOperation> RecoveryService::GetOperations() const {
  std::lock_guard lock(mutex_);
  return {history_.begin(), history_.end()};
}

RecoveryStats RecoveryService::GetRecoveryStats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

void RecoveryService::OnOperation(OperationListener listener) {
  std::lock_guard lock(mutex_);
  listeners_.push_back(std::move(listener));
}

} // namespace stagesync::recovery
