#include "internal/store/status_repository.hpp"

#include <set>

#include "internal/observability/logging.hpp"
#include "internal/store/status_codec.hpp"
#include "internal/util/errors.hpp"

namespace stagesync::store {

namespace {

constexpr const char* kEventsPrefix   = "events/";
constexpr const char* kStatusesDir    = "/artist-statuses/";
constexpr const char* kCountersPrefix = "counters/";
constexpr const char* kJsonSuffix     = ".json";

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void ValidateSegment(const std::string& segment, const char* what) {
  if (segment.empty() || segment.find('/') != std::string::npos) {
    throw util::InvalidArgument(std::string("invalid ") + what + ": '" + segment + "'");
  }
}

} // namespace

StatusRepository::StatusRepository(std::shared_ptr<DocumentStore> store) : store_(std::move(store)) {
}

std::string StatusRepository::StatusKey(const std::string& event_id, const std::string& artist_id) {
  ValidateSegment(event_id, "event id");
  ValidateSegment(artist_id, "artist id");
  return StatusPrefix(event_id) + artist_id + kJsonSuffix;
}

std::string StatusRepository::StatusPrefix(const std::string& event_id) {
  return std::string(kEventsPrefix) + event_id + kStatusesDir;
}

std::string StatusRepository::CounterKey(const std::string& name) {
  ValidateSegment(name, "counter name");
  return std::string(kCountersPrefix) + name + kJsonSuffix;
}

// ------------------------------------------------------------
// Status records
// ------------------------------------------------------------

std::optional<model::StatusRecord> StatusRepository::GetStatus(const std::string& event_id, const std::string& artist_id) {
  auto json = store_->Get(StatusKey(event_id, artist_id));
  if (!json) return std::nullopt;

  return DecodeStatus(*json);
}

std::vector<model::StatusRecord> StatusRepository::ListStatuses(const std::string& event_id) {
  std::vector<model::StatusRecord> records;

  for (const auto& key : store_->List(StatusPrefix(event_id))) {
    if (!EndsWith(key, kJsonSuffix)) continue;

    auto json = store_->Get(key);
    if (!json) continue;

    try {
      records.push_back(DecodeStatus(*json));
    } catch (const util::InvalidArgument& e) {
      STAGESYNC_LOG_WARN("Skipping malformed status document",
                         {observability::StringField("store", store_->Name()), observability::StringField("key", key),
                          observability::StringField("error", e.what())});
    }
  }

  return records;
}

std::vector<std::string> StatusRepository::ListEvents() {
  std::set<std::string> events;
  const std::string     prefix(kEventsPrefix);

  for (const auto& key : store_->List(prefix)) {
    const auto end = key.find('/', prefix.size());
    if (end == std::string::npos) continue;
    if (key.compare(end, std::string(kStatusesDir).size(), kStatusesDir) != 0) continue;
    events.insert(key.substr(prefix.size(), end - prefix.size()));
  }

  return {events.begin(), events.end()};
}

void StatusRepository::PutStatus(model::StatusRecord record) {
  record.dirty = false;
  store_->Put(StatusKey(record.event_id, record.artist_id), EncodeStatus(record));
}

bool StatusRepository::DeleteStatus(const std::string& event_id, const std::string& artist_id) {
  return store_->Delete(StatusKey(event_id, artist_id));
}

model::StatusRecord StatusRepository::MergePatch(const std::string& event_id, const std::string& artist_id, const model::StatusPatch& patch) {
  auto existing = GetStatus(event_id, artist_id);

  if (existing && patch.version && existing->version > *patch.version) {
    return *existing;
  }

  model::StatusRecord record;
  if (existing) {
    record = *existing;
  } else {
    record.artist_id = artist_id;
    record.event_id  = event_id;
  }

  model::ApplyFields(record, patch);
  record.version   = patch.version ? *patch.version : record.version + 1;
  record.timestamp = patch.timestamp ? *patch.timestamp : util::Now();
  record.dirty     = false;

  PutStatus(record);
  return record;
}

// ------------------------------------------------------------
// Counters
// ------------------------------------------------------------

std::optional<uint64_t> StatusRepository::GetCounter(const std::string& name) {
  auto json = store_->Get(CounterKey(name));
  if (!json) return std::nullopt;

  stagesync::v1::CounterDocument doc;
  FromJson(*json, &doc);
  return doc.current_id();
}

void StatusRepository::PutCounter(const std::string& name, uint64_t value) {
  stagesync::v1::CounterDocument doc;
  doc.set_current_id(value);
  store_->Put(CounterKey(name), ToJson(doc));
}

std::vector<std::string> StatusRepository::ListCounters() {
  std::vector<std::string> names;
  const std::string        prefix(kCountersPrefix);
  const std::string        suffix(kJsonSuffix);

  for (const auto& key : store_->List(prefix)) {
    if (!EndsWith(key, suffix)) continue;
    auto name = key.substr(prefix.size(), key.size() - prefix.size() - suffix.size());
    if (name.empty() || name.find('/') != std::string::npos) continue;
    names.push_back(std::move(name));
  }

  return names;
}

bool StatusRepository::Ping() {
  return store_->Ping();
}

} // namespace stagesync::store
