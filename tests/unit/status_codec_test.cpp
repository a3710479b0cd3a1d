#include "internal/store/status_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using stagesync::model::PerformanceStatus;
using stagesync::model::StatusRecord;

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const stagesync::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestJsonUsesCamelCaseKeys() {
  StatusRecord record;
  record.artist_id          = "artist-1";
  record.event_id           = "event-1";
  record.performance_status = PerformanceStatus::kCurrentlyOnStage;
  record.performance_order  = 2;
  record.timestamp          = stagesync::util::FromUnixMillis(1'720'000'000'000);
  record.version            = 3;

  const auto json = stagesync::store::EncodeStatus(record);
  assert(json.find("\"artistId\":\"artist-1\"") != std::string::npos);
  assert(json.find("\"performanceStatus\":\"currently_on_stage\"") != std::string::npos);
  assert(json.find("\"performanceOrder\":2") != std::string::npos);
  assert(json.find("performanceDate") == std::string::npos);

  const auto decoded = stagesync::store::DecodeStatus(json);
  assert(decoded.performance_status == PerformanceStatus::kCurrentlyOnStage);
  assert(decoded.performance_order == 2);
  assert(!decoded.performance_date.has_value());
  assert(decoded.timestamp == record.timestamp);
  assert(decoded.version == 3);
}

void TestDecodeRejectsBadDocuments() {
  assert(ThrowsInvalidArgument([] { stagesync::store::DecodeStatus("{not json"); }));
  assert(ThrowsInvalidArgument([] { stagesync::store::DecodeStatus(R"({"eventId":"e","performanceStatus":"completed"})"); }));
  assert(ThrowsInvalidArgument([] { stagesync::store::DecodeStatus(R"({"artistId":"a","performanceStatus":"completed"})"); }));
  assert(ThrowsInvalidArgument([] { stagesync::store::DecodeStatus(R"({"artistId":"a","eventId":"e","performanceStatus":"on_stage"})"); }));
}

void TestDecodeToleratesUnknownKeys() {
  const auto record =
      stagesync::store::DecodeStatus(R"({"artistId":"a","eventId":"e","performanceStatus":"next_on_deck","stageName":"Main","version":"4"})");
  assert(record.performance_status == PerformanceStatus::kNextOnDeck);
  assert(record.version == 4);
}

void TestPatchKeepsExplicitClears() {
  stagesync::model::StatusPatch patch;
  patch.performance_status     = PerformanceStatus::kCompleted;
  patch.clear_performance_date = true;
  patch.version                = 8;

  const auto back = stagesync::store::FromDocument(stagesync::store::ToDocument(patch));
  assert(back.performance_status == PerformanceStatus::kCompleted);
  assert(back.clear_performance_date);
  assert(!back.clear_performance_order);
  assert(!back.performance_order.has_value());
  assert(!back.timestamp.has_value());
  assert(back.version == 8);
}

void TestPatchWithUnknownStatusIsRejected() {
  stagesync::v1::StatusPatchDocument doc;
  doc.set_performance_status("backstage");
  assert(ThrowsInvalidArgument([&] { stagesync::store::FromDocument(doc); }));
}

} // namespace

int main() {
  TestJsonUsesCamelCaseKeys();
  TestDecodeRejectsBadDocuments();
  TestDecodeToleratesUnknownKeys();
  TestPatchKeepsExplicitClears();
  TestPatchWithUnknownStatusIsRejected();

  std::cout << "stagesync_unit_status_codec: pass\n";
  return 0;
}
