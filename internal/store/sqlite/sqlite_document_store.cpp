#include "sqlite_document_store.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stagesync::store::sqlite {

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

// Busy/locked/io errors are transient; anything else is a bug or corruption.
[[noreturn]] void Raise(sqlite3* db, int rc) {
  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      throw util::StoreUnavailable(std::string("sqlite: ") + sqlite3_errmsg(db));
    default:
      throw std::runtime_error(std::string("sqlite: ") + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDocumentStore::SqliteDocumentStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  Bootstrap();
}

void SqliteDocumentStore::Bootstrap() {
  db_->Exec("CREATE TABLE IF NOT EXISTS documents (key TEXT PRIMARY KEY, value TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);");
  db_->Exec("SELECT key,value,updated_at_ms FROM documents LIMIT 1;");
}

std::optional<std::string> SqliteDocumentStore::Get(const std::string& key) {
  auto st = db_->Prepare("SELECT value FROM documents WHERE key=?;");
  BindText(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) Raise(db_->Handle(), rc);

  return ColText(st.get(), 0);
}

void SqliteDocumentStore::Put(const std::string& key, const std::string& value) {
  auto st = db_->Prepare(
      "INSERT INTO documents(key,value,updated_at_ms) VALUES(?,?,?) "
      "ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at_ms=excluded.updated_at_ms;");
  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  sqlite3_bind_int64(st.get(), 3, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) Raise(db_->Handle(), rc);
}

bool SqliteDocumentStore::Delete(const std::string& key) {
  auto st = db_->Prepare("DELETE FROM documents WHERE key=?;");
  BindText(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) Raise(db_->Handle(), rc);

  return sqlite3_changes(db_->Handle()) > 0;
}

std::vector<std::string> SqliteDocumentStore::List(const std::string& prefix) {
  // substr() avoids LIKE wildcard escaping for keys containing '%' or '_'
  auto st = db_->Prepare("SELECT key FROM documents WHERE substr(key,1,length(?1))=?1 ORDER BY key;");
  BindText(st.get(), 1, prefix);

  std::vector<std::string> keys;
  int                      rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    keys.push_back(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) Raise(db_->Handle(), rc);

  return keys;
}

bool SqliteDocumentStore::Ping() {
  try {
    auto st = db_->Prepare("SELECT 1;");
    return sqlite3_step(st.get()) == SQLITE_ROW;
  } catch (const std::exception&) {
    return false;
  }
}

} // namespace stagesync::store::sqlite
