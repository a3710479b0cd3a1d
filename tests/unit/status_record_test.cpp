#include "internal/model/status_record.hpp"

#include <cassert>
#include <iostream>

namespace {

using stagesync::model::PerformanceStatus;
using stagesync::model::StatusPatch;
using stagesync::model::StatusRecord;

StatusRecord MakeRecord() {
  StatusRecord record;
  record.artist_id          = "artist-1";
  record.event_id           = "event-1";
  record.performance_status = PerformanceStatus::kNextOnDeck;
  record.performance_order  = 3;
  record.performance_date   = "2024-07-12";
  record.version            = 4;
  return record;
}

void TestStatusNamesRoundTrip() {
  for (auto status : {PerformanceStatus::kNotStarted, PerformanceStatus::kNextOnDeck, PerformanceStatus::kNextOnStage,
                      PerformanceStatus::kCurrentlyOnStage, PerformanceStatus::kCompleted}) {
    assert(stagesync::model::ParsePerformanceStatus(stagesync::model::ToString(status)) == status);
  }
  assert(!stagesync::model::ParsePerformanceStatus("on_stage").has_value());
  assert(!stagesync::model::ParsePerformanceStatus("").has_value());
}

void TestProgressRankFollowsShowOrder() {
  assert(stagesync::model::ProgressRank(PerformanceStatus::kNotStarted) < stagesync::model::ProgressRank(PerformanceStatus::kNextOnDeck));
  assert(stagesync::model::ProgressRank(PerformanceStatus::kCurrentlyOnStage) < stagesync::model::ProgressRank(PerformanceStatus::kCompleted));
}

void TestApplyFieldsLeavesUnsetFieldsAlone() {
  auto record = MakeRecord();

  StatusPatch patch;
  patch.performance_status = PerformanceStatus::kCompleted;
  stagesync::model::ApplyFields(record, patch);

  assert(record.performance_status == PerformanceStatus::kCompleted);
  assert(record.performance_order == 3);
  assert(record.performance_date == "2024-07-12");
  assert(record.version == 4);
}

void TestApplyFieldsClearsNullableFields() {
  auto record = MakeRecord();

  StatusPatch patch;
  patch.performance_order       = 9;
  patch.clear_performance_order = true;
  patch.clear_performance_date  = true;
  stagesync::model::ApplyFields(record, patch);

  assert(!record.performance_order.has_value());
  assert(!record.performance_date.has_value());
}

void TestDiffNamesEveryChangedField() {
  auto a = MakeRecord();
  auto b = MakeRecord();
  assert(stagesync::model::SameTrackedFields(a, b));

  b.performance_status = PerformanceStatus::kCompleted;
  b.performance_order.reset();
  b.version = 99;

  const auto diff = stagesync::model::DiffTrackedFields(a, b);
  assert(diff.size() == 2);
  assert(diff[0] == "performanceStatus");
  assert(diff[1] == "performanceOrder");
}

void TestPatchFromReproducesRecord() {
  const auto source = MakeRecord();

  StatusRecord target;
  target.performance_order = 7;
  stagesync::model::ApplyFields(target, stagesync::model::PatchFrom(source));
  assert(stagesync::model::SameTrackedFields(source, target));

  auto empty_order = MakeRecord();
  empty_order.performance_order.reset();
  stagesync::model::ApplyFields(target, stagesync::model::PatchFrom(empty_order));
  assert(!target.performance_order.has_value());
}

} // namespace

int main() {
  TestStatusNamesRoundTrip();
  TestProgressRankFollowsShowOrder();
  TestApplyFieldsLeavesUnsetFieldsAlone();
  TestApplyFieldsClearsNullableFields();
  TestDiffNamesEveryChangedField();
  TestPatchFromReproducesRecord();

  std::cout << "stagesync_unit_status_record: pass\n";
  return 0;
}
