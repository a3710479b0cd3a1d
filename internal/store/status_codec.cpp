#include "internal/store/status_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace stagesync::store {

namespace v1 = stagesync::v1;

namespace {

model::PerformanceStatus ParseStatusOrThrow(const std::string& text) {
  auto status = model::ParsePerformanceStatus(text);
  if (!status) {
    throw util::InvalidArgument("unknown performance status: '" + text + "'");
  }
  return *status;
}

} // namespace

v1::StatusDocument ToDocument(const model::StatusRecord& record) {
  v1::StatusDocument doc;
  doc.set_artist_id(record.artist_id);
  doc.set_event_id(record.event_id);
  doc.set_performance_status(std::string(model::ToString(record.performance_status)));
  if (record.performance_order) doc.set_performance_order(*record.performance_order);
  if (record.performance_date) doc.set_performance_date(*record.performance_date);
  *doc.mutable_timestamp() = util::ToProto(record.timestamp);
  doc.set_version(record.version);
  doc.set_dirty(record.dirty);
  return doc;
}

model::StatusRecord FromDocument(const v1::StatusDocument& doc) {
  if (doc.artist_id().empty()) throw util::InvalidArgument("status document without artistId");
  if (doc.event_id().empty()) throw util::InvalidArgument("status document without eventId");

  model::StatusRecord record;
  record.artist_id          = doc.artist_id();
  record.event_id           = doc.event_id();
  record.performance_status = ParseStatusOrThrow(doc.performance_status());
  if (doc.has_performance_order()) record.performance_order = doc.performance_order();
  if (doc.has_performance_date()) record.performance_date = doc.performance_date();
  record.timestamp = util::FromProto(doc.timestamp());
  record.version   = doc.version();
  record.dirty     = doc.dirty();
  return record;
}

v1::StatusPatchDocument ToDocument(const model::StatusPatch& patch) {
  v1::StatusPatchDocument doc;
  if (patch.performance_status) doc.set_performance_status(std::string(model::ToString(*patch.performance_status)));
  if (patch.performance_order) doc.set_performance_order(*patch.performance_order);
  doc.set_clear_performance_order(patch.clear_performance_order);
  if (patch.performance_date) doc.set_performance_date(*patch.performance_date);
  doc.set_clear_performance_date(patch.clear_performance_date);
  if (patch.timestamp) *doc.mutable_timestamp() = util::ToProto(*patch.timestamp);
  if (patch.version) doc.set_version(*patch.version);
  return doc;
}

model::StatusPatch FromDocument(const v1::StatusPatchDocument& doc) {
  model::StatusPatch patch;
  if (doc.has_performance_status()) patch.performance_status = ParseStatusOrThrow(doc.performance_status());
  if (doc.has_performance_order()) patch.performance_order = doc.performance_order();
  patch.clear_performance_order = doc.clear_performance_order();
  if (doc.has_performance_date()) patch.performance_date = doc.performance_date();
  patch.clear_performance_date = doc.clear_performance_date();
  if (doc.has_timestamp()) patch.timestamp = util::FromProto(doc.timestamp());
  if (doc.has_version()) patch.version = doc.version();
  return patch;
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Malformed " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

std::string EncodeStatus(const model::StatusRecord& record) {
  return ToJson(ToDocument(record));
}

model::StatusRecord DecodeStatus(const std::string& json) {
  v1::StatusDocument doc;
  FromJson(json, &doc);
  return FromDocument(doc);
}

} // namespace stagesync::store
