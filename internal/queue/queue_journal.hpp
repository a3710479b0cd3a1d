#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/queue/queued_update.hpp"
#include "internal/store/document_store.hpp"

namespace stagesync::queue {

/*
  Write-ahead copy of the update queue in the local store, one document per
  entry under queue/<updateId>.json. Lets a restarted process pick up
  write-behind updates it had accepted but not yet persisted.
*/
class QueueJournal {
 public:
  explicit QueueJournal(std::shared_ptr<store::DocumentStore> store);

  void Save(const QueuedUpdate& update);
  void Erase(const std::string& id);

  // Malformed entries are logged and dropped.
  std::vector<QueuedUpdate> LoadAll();

  static std::string Key(const std::string& id);

 private:
  std::shared_ptr<store::DocumentStore> store_;
};

} // namespace stagesync::queue
