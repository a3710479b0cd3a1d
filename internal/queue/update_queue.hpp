#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/queue/queue_journal.hpp"
#include "internal/queue/queued_update.hpp"

namespace stagesync::queue {

/*
  Durable side of a queued update. Implementations throw on failure; the
  returned record is what the durable store holds after the write.
*/
class StatusWriter {
 public:
  virtual ~StatusWriter() = default;

  virtual model::StatusRecord Write(const QueuedUpdate& update) = 0;
};

struct QueueOptions {
  std::uint32_t             max_retries{3};
  std::size_t               batch_size{10};
  std::chrono::milliseconds retry_delay{1000};
  std::chrono::milliseconds max_retry_delay{30000};
};

struct QueueStats {
  std::size_t   total_queued    = 0;
  std::size_t   processing      = 0;
  std::uint64_t failed          = 0;
  std::uint64_t completed       = 0;
  double        average_retries = 0.0;
};

struct ProcessReport {
  std::size_t               attempted = 0;
  std::size_t               succeeded = 0;
  std::size_t               retried   = 0;
  std::vector<QueuedUpdate> failed; // removed after exhausting retries
};

/*
  UpdateQueue

  Priority write-behind queue. Entries drain high > normal > low and FIFO
  inside a priority. A failed write is retried with exponential backoff
  (retry_delay * 2^(retry_count-1), capped at max_retry_delay) and dropped
  once retry_count exceeds max_retries. Drains never overlap: a Process call
  made while another is running returns an empty report.
*/
class UpdateQueue {
 public:
  using PersistedListener = std::function<void(const QueuedUpdate&, const model::StatusRecord&)>;
  using FailureListener   = std::function<void(const QueuedUpdate&)>;

  UpdateQueue(QueueOptions options, std::shared_ptr<StatusWriter> writer, std::shared_ptr<util::Clock> clock = std::make_shared<util::SystemClock>(),
              std::shared_ptr<QueueJournal> journal = nullptr);

  std::string Enqueue(QueuedUpdate update);
  bool        Remove(const std::string& id);
  void        Clear();

  std::vector<QueuedUpdate> GetAllUpdates() const;
  std::size_t               Size() const;

  ProcessReport Process();

  // Resets the retry state and moves the entry to the back of its priority.
  bool Retry(const std::string& id);

  void Pause();
  void Resume();
  bool IsPaused() const;

  // Reload journaled entries; returns how many were added.
  std::size_t Restore();

  QueueStats GetStats() const;

  void OnPersisted(PersistedListener listener);
  void OnTerminalFailure(FailureListener listener);

  std::chrono::milliseconds BackoffFor(std::uint32_t retry_count) const;

 private:
  // (band, sequence): band 0 drains first
  using OrderKey = std::pair<int, std::uint64_t>;

  OrderKey NextKey(UpdatePriority priority);
  void     Insert(QueuedUpdate update);
  void     JournalSave(const QueuedUpdate& update);
  void     JournalErase(const std::string& id);

  QueueOptions                  options_;
  std::shared_ptr<StatusWriter> writer_;
  std::shared_ptr<util::Clock>  clock_;
  std::shared_ptr<QueueJournal> journal_;

  mutable std::mutex                        mutex_;
  std::map<OrderKey, QueuedUpdate>          entries_;
  std::unordered_map<std::string, OrderKey> index_;
  std::uint64_t                             next_seq_  = 0;
  std::uint64_t                             completed_ = 0;
  std::uint64_t                             failed_    = 0;
  std::size_t                               in_flight_ = 0;
  bool                                      paused_    = false;

  std::atomic<bool> processing_{false};

  std::mutex                     listeners_mutex_;
  std::vector<PersistedListener> persisted_listeners_;
  std::vector<FailureListener>   failure_listeners_;
};

} // namespace stagesync::queue
