#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/status_record.hpp"
#include "internal/store/document_store.hpp"

namespace stagesync::store {

/*
  Typed view over a DocumentStore.

  Layout:
      events/<eventId>/artist-statuses/<artistId>.json   status records
      counters/<name>.json                               {"currentId": N}
      sync/metadata.json                                 last sync run

  Records are always written with dirty=false: a stored record is by
  definition persisted.
*/
class StatusRepository {
 public:
  explicit StatusRepository(std::shared_ptr<DocumentStore> store);

  static std::string StatusKey(const std::string& event_id, const std::string& artist_id);
  static std::string StatusPrefix(const std::string& event_id);
  static std::string CounterKey(const std::string& name);

  std::optional<model::StatusRecord> GetStatus(const std::string& event_id, const std::string& artist_id);
  std::vector<model::StatusRecord>   ListStatuses(const std::string& event_id);
  std::vector<std::string>           ListEvents();
  void                               PutStatus(model::StatusRecord record);
  bool                               DeleteStatus(const std::string& event_id, const std::string& artist_id);

  /*
    Merge a patch into the stored record (creating it when absent).
    A stored record with a higher version than patch.version wins and is
    returned unchanged.
  */
  model::StatusRecord MergePatch(const std::string& event_id, const std::string& artist_id, const model::StatusPatch& patch);

  std::optional<uint64_t>  GetCounter(const std::string& name);
  void                     PutCounter(const std::string& name, uint64_t value);
  std::vector<std::string> ListCounters();

  bool Ping();

  const std::shared_ptr<DocumentStore>& Store() const {
    return store_;
  }

 private:
  std::shared_ptr<DocumentStore> store_;
};

} // namespace stagesync::store
