#include "internal/store/memory_document_store.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace stagesync::store {

MemoryDocumentStore::MemoryDocumentStore(std::string name) : name_(std::move(name)) {
}

void MemoryDocumentStore::CheckAvailable() const {
  if (!available_) {
    throw util::StoreUnavailable(name_ + " store unavailable");
  }
}

std::optional<std::string> MemoryDocumentStore::Get(const std::string& key) {
  CheckAvailable();
  std::shared_lock lock(mutex_);

  auto it = documents_.find(key);
  if (it == documents_.end()) return std::nullopt;

  return it->second;
}

void MemoryDocumentStore::Put(const std::string& key, const std::string& value) {
  CheckAvailable();
  std::unique_lock lock(mutex_);
  documents_[key] = value;
  ++writes_;
}

bool MemoryDocumentStore::Delete(const std::string& key) {
  CheckAvailable();
  std::unique_lock lock(mutex_);
  return documents_.erase(key) > 0;
}

std::vector<std::string> MemoryDocumentStore::List(const std::string& prefix) {
  CheckAvailable();
  std::shared_lock lock(mutex_);

  std::vector<std::string> keys;
  for (auto it = documents_.lower_bound(prefix); it != documents_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(it->first);
  }
  return keys;
}

bool MemoryDocumentStore::Ping() {
  return available_;
}

} // namespace stagesync::store
