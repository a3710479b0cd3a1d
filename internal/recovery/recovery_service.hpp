#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/cache_manager.hpp"
#include "internal/recovery/health_probe.hpp"
#include "internal/store/status_repository.hpp"

namespace stagesync::recovery {

enum class RecoveryType {
  kCacheCorruption,
  kNetworkFailure,
  kDataInconsistency,
  kSyncFailure,
};

enum class OperationStatus {
  kPending,
  kInProgress,
  kCompleted,
  kFailed,
};

std::string_view            ToString(RecoveryType type);
std::string_view            ToString(OperationStatus status);
std::optional<RecoveryType> ParseRecoveryType(std::string_view text);

struct RecoveryOperation {
  std::string                id;
  RecoveryType               type = RecoveryType::kCacheCorruption;
  std::string                event_id;
  std::optional<std::string> performance_date;
  util::TimePoint            timestamp{};
  OperationStatus            status = OperationStatus::kPending;
  std::string                error;
  std::uint32_t              retry_count = 0;
  std::uint32_t              max_retries = 0;

  // Items a procedure worked through; zero for whole-cache procedures.
  std::size_t items_total     = 0;
  std::size_t items_recovered = 0;
};

// Inputs for AutoRecover; each type reads only its own field.
struct RecoveryContext {
  std::vector<queue::QueuedUpdate> failed_operations;
  std::vector<std::string>         artist_ids;
};

struct RecoveryOptions {
  std::chrono::milliseconds connectivity_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};
  std::size_t               history_limit{100};
  std::uint32_t             max_retries{3};
};

struct RecoveryStats {
  std::uint64_t                  total_operations      = 0;
  std::uint64_t                  successful_recoveries = 0;
  std::uint64_t                  failed_recoveries     = 0;
  std::optional<util::TimePoint> last_recovery_time;
};

/*
  RecoveryService

  Typed repair procedures over the CacheManager. Each call is tracked as a
  RecoveryOperation (pending -> in_progress -> completed | failed), kept in a
  bounded history and reported to listeners. Procedures report failure by
  returning false; they do not throw.

  A failing procedure is re-run up to max_retries times, except after a
  connectivity timeout, which already waited out its budget.
*/
class RecoveryService {
 public:
  using OperationListener = std::function<void(const RecoveryOperation&)>;

  RecoveryService(std::shared_ptr<core::CacheManager> manager, std::shared_ptr<store::StatusRepository> durable, std::shared_ptr<HealthProbe> probe,
                  RecoveryOptions options = {}, std::shared_ptr<util::Clock> clock = std::make_shared<util::SystemClock>());

  // Destroy, re-initialize and reload; fails when the cache is still empty.
  bool RecoverFromCacheCorruption(const std::string& event_id, const std::optional<std::string>& performance_date);

  // Wait for the durable store, requeue the failed updates, flush dirty entries.
  bool RecoverFromNetworkFailure(const std::string& event_id, const std::optional<std::string>& performance_date,
                                 const std::vector<queue::QueuedUpdate>& failed_operations = {});

  // Re-resolve the given artists against the durable store; none means a full reload.
  bool RecoverFromDataInconsistency(const std::string& event_id, const std::optional<std::string>& performance_date,
                                    const std::vector<std::string>& artist_ids = {});

  // Persist dirty entries one by one; succeeds when at least one (or none needed) made it.
  bool RecoverFromSyncFailure(const std::string& event_id, const std::optional<std::string>& performance_date);

  // Returns false immediately while another AutoRecover is running.
  bool AutoRecover(RecoveryType type, const std::string& event_id, const std::optional<std::string>& performance_date,
                   const RecoveryContext& context = {});

  bool IsRecovering() const {
    return recovering_;
  }

  std::vector<RecoveryOperation> GetOperations() const;
  RecoveryStats                  GetRecoveryStats() const;

  void OnOperation(OperationListener listener);

 private:
  bool Run(RecoveryType type, const std::string& event_id, const std::optional<std::string>& performance_date,
           const std::function<void(RecoveryOperation&)>& procedure);
  void WaitForConnectivity();
  void Report(const RecoveryOperation& operation);

  std::shared_ptr<core::CacheManager>      manager_;
  std::shared_ptr<store::StatusRepository> durable_;
  std::shared_ptr<HealthProbe>             probe_;
  RecoveryOptions                          options_;
  std::shared_ptr<util::Clock>             clock_;

  std::atomic<bool> recovering_{false};

  mutable std::mutex             mutex_;
  std::deque<RecoveryOperation>  history_;
  RecoveryStats                  stats_;
  std::vector<OperationListener> listeners_;
};

} // namespace stagesync::recovery
