#include "internal/store/status_repository.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/store/memory_document_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using stagesync::model::PerformanceStatus;
using stagesync::model::StatusPatch;
using stagesync::model::StatusRecord;
using stagesync::store::MemoryDocumentStore;
using stagesync::store::StatusRepository;

StatusRecord MakeRecord(const std::string& event_id, const std::string& artist_id, std::uint64_t version) {
  StatusRecord record;
  record.artist_id          = artist_id;
  record.event_id           = event_id;
  record.performance_status = PerformanceStatus::kNextOnDeck;
  record.version            = version;
  record.dirty              = true;
  return record;
}

void TestKeyLayout() {
  assert(StatusRepository::StatusKey("fest-24", "artist-1") == "events/fest-24/artist-statuses/artist-1.json");
  assert(StatusRepository::CounterKey("artists") == "counters/artists.json");

  bool threw = false;
  try {
    StatusRepository::StatusKey("fest/24", "artist-1");
  } catch (const stagesync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestStoredRecordsAreNeverDirty() {
  StatusRepository repo(std::make_shared<MemoryDocumentStore>());
  repo.PutStatus(MakeRecord("e1", "a", 2));

  auto stored = repo.GetStatus("e1", "a");
  assert(stored.has_value());
  assert(!stored->dirty);
  assert(stored->version == 2);
  assert(!repo.GetStatus("e1", "missing").has_value());
}

void TestListingByEvent() {
  auto             store = std::make_shared<MemoryDocumentStore>();
  StatusRepository repo(store);
  repo.PutStatus(MakeRecord("e1", "a", 1));
  repo.PutStatus(MakeRecord("e1", "b", 1));
  repo.PutStatus(MakeRecord("e2", "a", 1));
  store->Put("events/e1/artist-statuses/broken.json", "{");
  store->Put("events/e3/notes.txt", "x");

  assert(repo.ListStatuses("e1").size() == 2);
  assert(repo.ListStatuses("e2").size() == 1);
  assert((repo.ListEvents() == std::vector<std::string>{"e1", "e2"}));

  assert(repo.DeleteStatus("e1", "a"));
  assert(repo.ListStatuses("e1").size() == 1);
}

void TestMergePatchCreatesAndMerges() {
  StatusRepository repo(std::make_shared<MemoryDocumentStore>());

  StatusPatch create;
  create.performance_status = PerformanceStatus::kNextOnStage;
  create.performance_order  = 1;
  auto created              = repo.MergePatch("e1", "a", create);
  assert(created.version == 1);
  assert(created.performance_order == 1);

  StatusPatch advance;
  advance.performance_status = PerformanceStatus::kCurrentlyOnStage;
  advance.version            = 5;
  auto merged                = repo.MergePatch("e1", "a", advance);
  assert(merged.version == 5);
  assert(merged.performance_status == PerformanceStatus::kCurrentlyOnStage);
  assert(merged.performance_order == 1);
}

void TestMergePatchKeepsNewerStoredRecord() {
  StatusRepository repo(std::make_shared<MemoryDocumentStore>());
  repo.PutStatus(MakeRecord("e1", "a", 6));

  StatusPatch stale;
  stale.performance_status = PerformanceStatus::kNotStarted;
  stale.version            = 4;

  auto result = repo.MergePatch("e1", "a", stale);
  assert(result.version == 6);
  assert(result.performance_status == PerformanceStatus::kNextOnDeck);
  assert(repo.GetStatus("e1", "a")->performance_status == PerformanceStatus::kNextOnDeck);
}

void TestCounters() {
  StatusRepository repo(std::make_shared<MemoryDocumentStore>());
  assert(!repo.GetCounter("artists").has_value());

  repo.PutCounter("artists", 42);
  repo.PutCounter("events", 7);
  assert(repo.GetCounter("artists") == 42u);
  assert((repo.ListCounters() == std::vector<std::string>{"artists", "events"}));
}

void TestUnavailableStoreSurfacesStoreUnavailable() {
  auto             store = std::make_shared<MemoryDocumentStore>();
  StatusRepository repo(store);
  store->SetAvailable(false);

  assert(!repo.Ping());
  bool threw = false;
  try {
    repo.GetStatus("e1", "a");
  } catch (const stagesync::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestKeyLayout();
  TestStoredRecordsAreNeverDirty();
  TestListingByEvent();
  TestMergePatchCreatesAndMerges();
  TestMergePatchKeepsNewerStoredRecord();
  TestCounters();
  TestUnavailableStoreSurfacesStoreUnavailable();

  std::cout << "stagesync_unit_status_repository: pass\n";
  return 0;
}
