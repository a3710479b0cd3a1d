#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/store/document_store.hpp"
#include "internal/store/memory_document_store.hpp"
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_document_store.hpp"
#include "internal/store/status_repository.hpp"
#include "internal/util/errors.hpp"

#if STAGESYNC_CLOUD_ARROW
#include <arrow/filesystem/localfs.h>

#include "internal/store/object/object_document_store.hpp"
#endif

namespace {

using stagesync::model::PerformanceStatus;
using stagesync::model::StatusRecord;
using stagesync::store::DocumentStore;
using stagesync::store::StatusRepository;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                          name;
  std::function<std::shared_ptr<DocumentStore>()>      make_store;
  std::function<bool()>                                supports_restart;
  std::function<void(std::shared_ptr<DocumentStore>&)> restart;
  std::function<void()>                                cleanup;
};

void VerifyPutGetDelete(DocumentStore& store, const std::string& key) {
  assert(!store.Get(key).has_value());

  store.Put(key, R"({"a":1})");
  assert(store.Get(key) == std::string(R"({"a":1})"));

  store.Put(key, R"({"a":2})");
  assert(store.Get(key) == std::string(R"({"a":2})"));

  assert(store.Delete(key));
  assert(!store.Delete(key));
  assert(!store.Get(key).has_value());
}

void VerifyPrefixListing(DocumentStore& store, const std::string& root) {
  store.Put(root + "/events/e1/artist-statuses/b.json", "{}");
  store.Put(root + "/events/e1/artist-statuses/a.json", "{}");
  store.Put(root + "/events/e2/artist-statuses/c.json", "{}");
  store.Put(root + "/counters/artists.json", "{}");

  const auto e1 = store.List(root + "/events/e1/");
  assert(e1.size() == 2);
  assert(e1[0] == root + "/events/e1/artist-statuses/a.json");
  assert(e1[1] == root + "/events/e1/artist-statuses/b.json");

  assert(store.List(root + "/events/").size() == 3);
  assert(store.List(root + "/").size() == 4);
  assert(store.List(root + "/missing/").empty());
}

void VerifyKeysWithLikeWildcards(DocumentStore& store, const std::string& root) {
  store.Put(root + "/a_b%c.json", "1");
  store.Put(root + "/axbyc.json", "2");

  const auto keys = store.List(root + "/a_b%");
  assert(keys.size() == 1);
  assert(keys[0] == root + "/a_b%c.json");
}

void VerifyRepositoryOnTop(const std::shared_ptr<DocumentStore>& store, const std::string& event_id) {
  StatusRepository repo(store);

  StatusRecord record;
  record.artist_id          = "artist-1";
  record.event_id           = event_id;
  record.performance_status = PerformanceStatus::kCurrentlyOnStage;
  record.performance_order  = 3;
  record.version            = 4;
  repo.PutStatus(record);
  repo.PutCounter(event_id + "-artists", 12);

  auto stored = repo.GetStatus(event_id, "artist-1");
  assert(stored.has_value());
  assert(stored->performance_status == PerformanceStatus::kCurrentlyOnStage);
  assert(stored->performance_order == 3);
  assert(repo.ListStatuses(event_id).size() == 1);
  assert(repo.GetCounter(event_id + "-artists") == 12u);
  assert(repo.Ping());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& event_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  {
    StatusRepository repo(store);
    StatusRecord     record;
    record.artist_id          = "durable";
    record.event_id           = event_id;
    record.performance_status = PerformanceStatus::kCompleted;
    record.version            = 9;
    repo.PutStatus(record);
  }

  backend.restart(store);

  StatusRepository repo(store);
  auto             stored = repo.GetStatus(event_id, "durable");
  assert(stored.has_value());
  assert(stored->version == 9);
  assert(stored->performance_status == PerformanceStatus::kCompleted);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<stagesync::store::MemoryDocumentStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<DocumentStore>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("stagesync_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() -> std::shared_ptr<DocumentStore> {
    auto db = std::make_shared<stagesync::store::sqlite::SqliteDB>(db_path);
    return std::make_shared<stagesync::store::sqlite::SqliteDocumentStore>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<DocumentStore>& store) { store = make_store(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}

#if STAGESYNC_CLOUD_ARROW
BackendFactory MakeObjectFactory() {
  auto root = (std::filesystem::temp_directory_path() / ("stagesync_integration_object_" + std::to_string(NowMs()))).string();

  auto make_store = [root]() -> std::shared_ptr<DocumentStore> {
    return std::make_shared<stagesync::store::object::ObjectDocumentStore>(std::make_shared<arrow::fs::LocalFileSystem>(), root);
  };

  return BackendFactory{
      .name             = "object",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<DocumentStore>& store) { store = make_store(); },
      .cleanup          = [root]() { std::filesystem::remove_all(root); },
  };
}

void VerifyObjectKeysCannotEscapeRoot(DocumentStore& store) {
  bool threw = false;
  try {
    store.Put("../outside.json", "{}");
  } catch (const stagesync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto store = backend.make_store();

  assert(store->Ping());
  VerifyPutGetDelete(*store, backend.name + "/single.json");
  VerifyPrefixListing(*store, backend.name + "-listing");
  if (backend.name != "object") {
    // Object keys map to paths; '%' and '_' are only interesting for SQL.
    VerifyKeysWithLikeWildcards(*store, backend.name + "-wildcards");
  }
  VerifyRepositoryOnTop(store, backend.name + "-event");

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if STAGESYNC_CLOUD_ARROW
  backends.push_back(MakeObjectFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if STAGESYNC_CLOUD_ARROW
  {
    auto object = MakeObjectFactory();
    auto store  = object.make_store();
    VerifyObjectKeysCannotEscapeRoot(*store);
    object.cleanup();
  }
#endif

  std::cout << "stagesync_integration_document_store_parity: pass\n";
  return 0;
}
