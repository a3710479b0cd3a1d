#include "internal/queue/update_queue.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace stagesync::queue {

using observability::IntField;
using observability::StringField;

namespace {

// Releases the drain flag on every exit path, listeners included.
class DrainGuard {
 public:
  explicit DrainGuard(std::atomic<bool>& flag) : flag_(flag) {
  }
  ~DrainGuard() {
    flag_ = false;
  }

  DrainGuard(const DrainGuard&)            = delete;
  DrainGuard& operator=(const DrainGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

} // namespace

std::string_view ToString(UpdatePriority priority) {
  switch (priority) {
    case UpdatePriority::kLow:
      return "low";
    case UpdatePriority::kNormal:
      return "normal";
    case UpdatePriority::kHigh:
      return "high";
  }
  return "normal";
}

UpdatePriority PriorityFor(model::PerformanceStatus status) {
  switch (status) {
    case model::PerformanceStatus::kNextOnDeck:
    case model::PerformanceStatus::kNextOnStage:
    case model::PerformanceStatus::kCurrentlyOnStage:
      return UpdatePriority::kHigh;
    case model::PerformanceStatus::kCompleted:
      return UpdatePriority::kNormal;
    case model::PerformanceStatus::kNotStarted:
      return UpdatePriority::kLow;
  }
  return UpdatePriority::kLow;
}

UpdateQueue::UpdateQueue(QueueOptions options, std::shared_ptr<StatusWriter> writer, std::shared_ptr<util::Clock> clock,
                         std::shared_ptr<QueueJournal> journal)
    : options_(options), writer_(std::move(writer)), clock_(std::move(clock)), journal_(std::move(journal)) {
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
}

UpdateQueue::OrderKey UpdateQueue::NextKey(UpdatePriority priority) {
  const int band = static_cast<int>(UpdatePriority::kHigh) - static_cast<int>(priority);
  return {band, next_seq_++};
}

void UpdateQueue::Insert(QueuedUpdate update) {
  auto key = NextKey(update.priority);
  index_[update.id] = key;
  entries_.emplace(key, std::move(update));
}

// Journal failures never block the in-memory queue.
void UpdateQueue::JournalSave(const QueuedUpdate& update) {
  if (!journal_) return;
  try {
    journal_->Save(update);
  } catch (const std::exception& e) {
    STAGESYNC_LOG_WARN("Queue journal write failed", {StringField("update_id", update.id), StringField("error", e.what())});
  }
}

void UpdateQueue::JournalErase(const std::string& id) {
  if (!journal_) return;
  try {
    journal_->Erase(id);
  } catch (const std::exception& e) {
    STAGESYNC_LOG_WARN("Queue journal erase failed", {StringField("update_id", id), StringField("error", e.what())});
  }
}

std::chrono::milliseconds UpdateQueue::BackoffFor(std::uint32_t retry_count) const {
  auto delay = options_.retry_delay;
  for (std::uint32_t i = 1; i < retry_count && delay < options_.max_retry_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, options_.max_retry_delay);
}

// ------------------------------------------------------------
// Queue maintenance
// ------------------------------------------------------------

std::string UpdateQueue::Enqueue(QueuedUpdate update) {
  if (update.id.empty()) update.id = util::NewId("upd");
  if (update.max_retries == 0) update.max_retries = options_.max_retries;
  update.enqueued_at = clock_->Now();

  std::string id = update.id;
  {
    std::lock_guard lock(mutex_);

    auto existing = index_.find(id);
    if (existing != index_.end()) {
      entries_.erase(existing->second);
      index_.erase(existing);
    }

    JournalSave(update);
    Insert(std::move(update));
    observability::Metrics::Instance().SetQueueDepth(entries_.size());
  }
  return id;
}

bool UpdateQueue::Remove(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto it = index_.find(id);
  if (it == index_.end()) return false;

  entries_.erase(it->second);
  index_.erase(it);
  JournalErase(id);
  return true;
}

void UpdateQueue::Clear() {
  std::lock_guard lock(mutex_);

  for (const auto& [id, _] : index_) {
    JournalErase(id);
  }
  entries_.clear();
  index_.clear();
}

std::vector<QueuedUpdate> UpdateQueue::GetAllUpdates() const {
  std::lock_guard lock(mutex_);

  std::vector<QueuedUpdate> all;
  all.reserve(entries_.size());
  for (const auto& [_, update] : entries_) {
    all.push_back(update);
  }
  return all;
}

std::size_t UpdateQueue::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

bool UpdateQueue::Retry(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto it = index_.find(id);
  if (it == index_.end()) return false;

  auto node = entries_.extract(it->second);
  index_.erase(it);

  auto& update       = node.mapped();
  update.retry_count = 0;
  update.next_retry_at.reset();
  JournalSave(update);
  Insert(std::move(update));
  return true;
}

void UpdateQueue::Pause() {
  std::lock_guard lock(mutex_);
  paused_ = true;
}

void UpdateQueue::Resume() {
  std::lock_guard lock(mutex_);
  paused_ = false;
}

bool UpdateQueue::IsPaused() const {
  std::lock_guard lock(mutex_);
  return paused_;
}

std::size_t UpdateQueue::Restore() {
  if (!journal_) return 0;

  auto restored = journal_->LoadAll();

  std::lock_guard lock(mutex_);
  std::size_t     added = 0;
  for (auto& update : restored) {
    if (index_.contains(update.id)) continue;
    Insert(std::move(update));
    ++added;
  }

  if (added > 0) {
    STAGESYNC_LOG_INFO("Restored queued updates from journal", {IntField("count", static_cast<std::int64_t>(added))});
  }
  return added;
}

// ------------------------------------------------------------
// Drain
// ------------------------------------------------------------

ProcessReport UpdateQueue::Process() {
  ProcessReport report;

  bool expected = false;
  if (!processing_.compare_exchange_strong(expected, true)) {
    return report;
  }
  DrainGuard guard(processing_);

  // Each item keeps the key it was taken under; Enqueue and Retry assign a new one.
  std::vector<std::pair<OrderKey, QueuedUpdate>> batch;
  {
    std::lock_guard lock(mutex_);
    if (paused_) {
      return report;
    }

    const auto now = clock_->Now();
    for (const auto& [key, update] : entries_) {
      if (batch.size() >= options_.batch_size) break;
      if (update.next_retry_at && *update.next_retry_at > now) continue;
      batch.emplace_back(key, update);
    }
    in_flight_ = batch.size();
  }

  struct Outcome {
    bool                error = false;
    std::string         message;
    model::StatusRecord persisted;
  };
  std::vector<Outcome> outcomes(batch.size());

  // Writes run without the queue lock so request handlers can keep enqueueing.
  for (std::size_t i = 0; i < batch.size(); ++i) {
    try {
      outcomes[i].persisted = writer_->Write(batch[i].second);
    } catch (const std::exception& e) {
      outcomes[i].error   = true;
      outcomes[i].message = e.what();
    }
  }

  std::vector<std::pair<QueuedUpdate, model::StatusRecord>> persisted;
  {
    std::lock_guard lock(mutex_);
    const auto      now = clock_->Now();

    for (std::size_t i = 0; i < batch.size(); ++i) {
      ++report.attempted;

      const auto& [key, written] = batch[i];

      auto idx = index_.find(written.id);
      // Removed or replaced while the write was in flight; a replacement still needs its own write.
      if (idx == index_.end() || idx->second != key) {
        if (!outcomes[i].error) ++report.succeeded;
        continue;
      }

      auto entry = entries_.find(idx->second);
      if (!outcomes[i].error) {
        ++report.succeeded;
        ++completed_;
        persisted.emplace_back(entry->second, outcomes[i].persisted);
        entries_.erase(entry);
        index_.erase(idx);
        JournalErase(written.id);
        continue;
      }

      auto& update = entry->second;
      ++update.retry_count;
      update.last_error = outcomes[i].message;

      if (update.retry_count > update.max_retries) {
        ++failed_;
        STAGESYNC_LOG_ERROR("Queued update failed permanently",
                            {StringField("update_id", update.id), StringField("artist_id", update.artist_id),
                             IntField("retries", update.retry_count), StringField("error", update.last_error)});
        report.failed.push_back(std::move(update));
        entries_.erase(entry);
        index_.erase(idx);
        JournalErase(written.id);
        continue;
      }

      update.next_retry_at = now + BackoffFor(update.retry_count);
      ++report.retried;
      STAGESYNC_LOG_WARN("Queued update failed, will retry",
                         {StringField("update_id", update.id), StringField("artist_id", update.artist_id),
                          IntField("retry_count", update.retry_count), StringField("error", update.last_error)});
      JournalSave(update);
    }

    in_flight_ = 0;
    observability::Metrics::Instance().SetQueueDepth(entries_.size());
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordQueueOutcome("persisted", report.succeeded);
  metrics.RecordQueueOutcome("retried", report.retried);
  metrics.RecordQueueOutcome("failed", report.failed.size());

  std::vector<PersistedListener> on_persisted;
  std::vector<FailureListener>   on_failure;
  {
    std::lock_guard lock(listeners_mutex_);
    on_persisted = persisted_listeners_;
    on_failure   = failure_listeners_;
  }
  for (const auto& [update, record] : persisted) {
    for (const auto& listener : on_persisted) listener(update, record);
  }
  for (const auto& update : report.failed) {
    for (const auto& listener : on_failure) listener(update);
  }

  return report;
}

QueueStats UpdateQueue::GetStats() const {
  std::lock_guard lock(mutex_);

  QueueStats stats;
  stats.total_queued = entries_.size();
  stats.processing   = in_flight_;
  stats.failed       = failed_;
  stats.completed    = completed_;

  if (!entries_.empty()) {
    std::uint64_t retries = 0;
    for (const auto& [_, update] : entries_) retries += update.retry_count;
    stats.average_retries = static_cast<double>(retries) / static_cast<double>(entries_.size());
  }
  return stats;
}

void UpdateQueue::OnPersisted(PersistedListener listener) {
  std::lock_guard lock(listeners_mutex_);
  persisted_listeners_.push_back(std::move(listener));
}

void UpdateQueue::OnTerminalFailure(FailureListener listener) {
  std::lock_guard lock(listeners_mutex_);
  failure_listeners_.push_back(std::move(listener));
}

} // namespace stagesync::queue
