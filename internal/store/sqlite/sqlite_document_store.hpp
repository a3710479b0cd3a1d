#pragma once

#include <memory>

#include "internal/store/document_store.hpp"
#include "internal/store/sqlite/sqlite_db.hpp"

namespace stagesync::store::sqlite {

/*
  Local document store on a single sqlite table:

      documents(key TEXT PRIMARY KEY, value TEXT, updated_at_ms INTEGER)
*/
class SqliteDocumentStore final : public DocumentStore {
 public:
  explicit SqliteDocumentStore(std::shared_ptr<SqliteDB> db);

  std::optional<std::string> Get(const std::string& key) override;
  void                       Put(const std::string& key, const std::string& value) override;
  bool                       Delete(const std::string& key) override;
  std::vector<std::string>   List(const std::string& prefix) override;
  bool                       Ping() override;

  std::string Name() const override {
    return "sqlite";
  }

 private:
  void Bootstrap();

  std::shared_ptr<SqliteDB> db_;
};

} // namespace stagesync::store::sqlite
