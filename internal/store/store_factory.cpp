#include "store_factory.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/store/memory_document_store.hpp"
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_document_store.hpp"
#if STAGESYNC_CLOUD_ARROW
#include "internal/store/object/arrow_utils.hpp"
#include "internal/store/object/object_document_store.hpp"
#endif

namespace stagesync::store {

std::shared_ptr<DocumentStore> StoreFactory::Build(const stagesync::runtime::config::DocumentStoreConfig& cfg) {
  using Backend = stagesync::runtime::config::DocumentStoreConfig;

  switch (cfg.backend_case()) {
    case Backend::kSqlite: {
      std::filesystem::path path = cfg.sqlite().path().empty() ? std::filesystem::path{"/tmp/stagesync/local.db"} : std::filesystem::path{cfg.sqlite().path()};
      if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
      auto db = std::make_shared<sqlite::SqliteDB>(path.string(), cfg.sqlite().wal_mode());
      return std::make_shared<sqlite::SqliteDocumentStore>(std::move(db));
    }

    case Backend::kObject: {
#if STAGESYNC_CLOUD_ARROW
      auto [fs, root] = object::Unwrap(object::ResolveFileSystem(cfg.object()));
      return std::make_shared<object::ObjectDocumentStore>(std::move(fs), std::move(root));
#else
      throw std::runtime_error("object store requested but not enabled at build time");
#endif
    }

    case Backend::kMemory:
    case Backend::BACKEND_NOT_SET:
      break;
  }

  return std::make_shared<MemoryDocumentStore>();
}

} // namespace stagesync::store
