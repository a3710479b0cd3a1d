#include "internal/queue/queue_journal.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/queue/update_queue.hpp"
#include "internal/store/memory_document_store.hpp"

namespace {

using stagesync::model::PerformanceStatus;
using stagesync::queue::QueuedUpdate;
using stagesync::queue::QueueJournal;
using stagesync::queue::UpdatePriority;
using stagesync::queue::UpdateQueue;
using stagesync::store::MemoryDocumentStore;

class FailingWriter final : public stagesync::queue::StatusWriter {
 public:
  stagesync::model::StatusRecord Write(const QueuedUpdate&) override {
    throw std::runtime_error("offline");
  }
};

class AcceptingWriter final : public stagesync::queue::StatusWriter {
 public:
  stagesync::model::StatusRecord Write(const QueuedUpdate& update) override {
    stagesync::model::StatusRecord record;
    record.artist_id = update.artist_id;
    record.event_id  = update.event_id;
    return record;
  }
};

QueuedUpdate MakeUpdate(const std::string& artist_id, UpdatePriority priority) {
  QueuedUpdate update;
  update.artist_id                  = artist_id;
  update.event_id                   = "event-1";
  update.priority                   = priority;
  update.updates.performance_status = PerformanceStatus::kCurrentlyOnStage;
  update.updates.performance_order  = 2;
  update.updates.version            = 5;
  return update;
}

void TestSaveAndLoadKeepsEveryField() {
  auto         store = std::make_shared<MemoryDocumentStore>();
  QueueJournal journal(store);

  auto update          = MakeUpdate("a", UpdatePriority::kHigh);
  update.id            = "upd-1";
  update.retry_count   = 2;
  update.max_retries   = 4;
  update.next_retry_at = stagesync::util::FromUnixMillis(1'700'000'005'000);
  update.enqueued_at   = stagesync::util::FromUnixMillis(1'700'000'000'000);
  update.last_error    = "timeout";
  journal.Save(update);

  assert(store->Get(QueueJournal::Key("upd-1")).has_value());

  const auto loaded = journal.LoadAll();
  assert(loaded.size() == 1);
  const auto& got = loaded[0];
  assert(got.id == "upd-1");
  assert(got.artist_id == "a");
  assert(got.priority == UpdatePriority::kHigh);
  assert(got.retry_count == 2);
  assert(got.max_retries == 4);
  assert(got.next_retry_at == update.next_retry_at);
  assert(got.enqueued_at == update.enqueued_at);
  assert(got.last_error == "timeout");
  assert(got.updates.performance_status == PerformanceStatus::kCurrentlyOnStage);
  assert(got.updates.performance_order == 2);
  assert(got.updates.version == 5);
}

void TestMalformedEntriesAreDropped() {
  auto         store = std::make_shared<MemoryDocumentStore>();
  QueueJournal journal(store);

  store->Put(QueueJournal::Key("broken"), "{not json");
  auto update = MakeUpdate("a", UpdatePriority::kLow);
  update.id   = "good";
  journal.Save(update);

  const auto loaded = journal.LoadAll();
  assert(loaded.size() == 1);
  assert(loaded[0].id == "good");
  assert(!store->Get(QueueJournal::Key("broken")).has_value());
}

void TestRestartedQueueRestoresPendingUpdates() {
  auto store   = std::make_shared<MemoryDocumentStore>();
  auto journal = std::make_shared<QueueJournal>(store);

  {
    UpdateQueue queue({}, std::make_shared<FailingWriter>(), std::make_shared<stagesync::util::SystemClock>(), journal);
    queue.Enqueue(MakeUpdate("low", UpdatePriority::kLow));
    queue.Enqueue(MakeUpdate("high", UpdatePriority::kHigh));
    queue.Process();
  }

  UpdateQueue restarted({}, std::make_shared<AcceptingWriter>(), std::make_shared<stagesync::util::SystemClock>(), journal);
  assert(restarted.Restore() == 2);
  assert(restarted.Restore() == 0);

  const auto all = restarted.GetAllUpdates();
  assert(all[0].artist_id == "high");
  assert(all[0].retry_count == 1);
  assert(all[1].artist_id == "low");

  for (auto update : all) assert(restarted.Retry(update.id));
  assert(restarted.Process().succeeded == 2);
  assert(store->List("queue/").empty());
}

} // namespace

int main() {
  TestSaveAndLoadKeepsEveryField();
  TestMalformedEntriesAreDropped();
  TestRestartedQueueRestoresPendingUpdates();

  std::cout << "stagesync_unit_queue_journal: pass\n";
  return 0;
}
