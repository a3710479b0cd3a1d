#include "internal/queue/queue_journal.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/store/status_codec.hpp"
#include "internal/util/errors.hpp"
#include "stagesync/v1/status.pb.h"

namespace stagesync::queue {

namespace {

constexpr const char* kQueuePrefix = "queue/";

stagesync::v1::UpdatePriority ToProto(UpdatePriority priority) {
  switch (priority) {
    case UpdatePriority::kLow:
      return stagesync::v1::UPDATE_PRIORITY_LOW;
    case UpdatePriority::kNormal:
      return stagesync::v1::UPDATE_PRIORITY_NORMAL;
    case UpdatePriority::kHigh:
      return stagesync::v1::UPDATE_PRIORITY_HIGH;
  }
  return stagesync::v1::UPDATE_PRIORITY_NORMAL;
}

UpdatePriority FromProto(stagesync::v1::UpdatePriority priority) {
  switch (priority) {
    case stagesync::v1::UPDATE_PRIORITY_LOW:
      return UpdatePriority::kLow;
    case stagesync::v1::UPDATE_PRIORITY_HIGH:
      return UpdatePriority::kHigh;
    default:
      return UpdatePriority::kNormal;
  }
}

std::string Encode(const QueuedUpdate& update) {
  stagesync::v1::QueuedUpdateDocument doc;
  doc.set_id(update.id);
  doc.set_artist_id(update.artist_id);
  doc.set_event_id(update.event_id);
  *doc.mutable_updates() = store::ToDocument(update.updates);
  doc.set_priority(ToProto(update.priority));
  doc.set_retry_count(update.retry_count);
  doc.set_max_retries(update.max_retries);
  if (update.next_retry_at) *doc.mutable_next_retry_at() = util::ToProto(*update.next_retry_at);
  *doc.mutable_enqueued_at() = util::ToProto(update.enqueued_at);
  doc.set_last_error(update.last_error);
  return store::ToJson(doc);
}

QueuedUpdate Decode(const std::string& json) {
  stagesync::v1::QueuedUpdateDocument doc;
  store::FromJson(json, &doc);
  if (doc.id().empty() || doc.artist_id().empty() || doc.event_id().empty()) {
    throw util::InvalidArgument("queue entry without id, artistId or eventId");
  }

  QueuedUpdate update;
  update.id          = doc.id();
  update.artist_id   = doc.artist_id();
  update.event_id    = doc.event_id();
  update.updates     = store::FromDocument(doc.updates());
  update.priority    = FromProto(doc.priority());
  update.retry_count = doc.retry_count();
  update.max_retries = doc.max_retries();
  if (doc.has_next_retry_at()) update.next_retry_at = util::FromProto(doc.next_retry_at());
  update.enqueued_at = util::FromProto(doc.enqueued_at());
  update.last_error  = doc.last_error();
  return update;
}

} // namespace

QueueJournal::QueueJournal(std::shared_ptr<store::DocumentStore> store) : store_(std::move(store)) {
}

std::string QueueJournal::Key(const std::string& id) {
  return std::string(kQueuePrefix) + id + ".json";
}

void QueueJournal::Save(const QueuedUpdate& update) {
  store_->Put(Key(update.id), Encode(update));
}

void QueueJournal::Erase(const std::string& id) {
  store_->Delete(Key(id));
}

std::vector<QueuedUpdate> QueueJournal::LoadAll() {
  std::vector<QueuedUpdate> updates;

  for (const auto& key : store_->List(kQueuePrefix)) {
    auto json = store_->Get(key);
    if (!json) continue;

    try {
      updates.push_back(Decode(*json));
    } catch (const util::InvalidArgument& e) {
      STAGESYNC_LOG_WARN("Dropping malformed queue journal entry", {observability::StringField("key", key), observability::StringField("error", e.what())});
      store_->Delete(key);
    }
  }

  std::stable_sort(updates.begin(), updates.end(), [](const QueuedUpdate& a, const QueuedUpdate& b) { return a.enqueued_at < b.enqueued_at; });
  return updates;
}

} // namespace stagesync::queue
