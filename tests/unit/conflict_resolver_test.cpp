#include "internal/conflict/conflict_resolver.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using stagesync::conflict::ConflictResolver;
using stagesync::conflict::ResolveOptions;
using stagesync::conflict::Strategy;
using stagesync::conflict::Winner;
using stagesync::model::PerformanceStatus;
using stagesync::model::StatusRecord;

const auto kBase = stagesync::util::FromUnixMillis(1'720'000'000'000);

StatusRecord MakeRecord(PerformanceStatus status, std::uint64_t version, std::chrono::milliseconds offset) {
  StatusRecord record;
  record.artist_id          = "artist-a";
  record.event_id           = "event-1";
  record.performance_status = status;
  record.version            = version;
  record.timestamp          = kBase + offset;
  return record;
}

void AssertSamePick(const StatusRecord& a, const StatusRecord& b, const ResolveOptions& options) {
  const auto ab = ConflictResolver::Resolve(a, b, options);
  const auto ba = ConflictResolver::Resolve(b, a, options);

  assert(ab.strategy == ba.strategy);
  assert(ab.winner != ba.winner);
  assert(ab.resolved.performance_status == ba.resolved.performance_status);
  assert(ab.resolved.version == ba.resolved.version);
  assert(ab.resolved.timestamp == ba.resolved.timestamp);
}

void TestNewerTimestampWinsEvenWithEqualVersion() {
  const auto local  = MakeRecord(PerformanceStatus::kNotStarted, 1, std::chrono::milliseconds(0));
  const auto remote = MakeRecord(PerformanceStatus::kCompleted, 1, std::chrono::seconds(2));

  const auto resolution = ConflictResolver::Resolve(local, remote);
  assert(resolution.strategy == Strategy::kTimestamp);
  assert(resolution.winner == Winner::kRemote);
  assert(resolution.resolved.performance_status == PerformanceStatus::kCompleted);
  assert(resolution.resolved.version == 1);
  assert(resolution.conflicts.size() == 1);
  assert(resolution.conflicts[0] == "performanceStatus");
}

void TestNewerTimestampBeatsHigherVersion() {
  const auto local  = MakeRecord(PerformanceStatus::kNextOnDeck, 9, std::chrono::milliseconds(0));
  const auto remote = MakeRecord(PerformanceStatus::kNextOnStage, 2, std::chrono::seconds(1));

  assert(ConflictResolver::Resolve(local, remote).winner == Winner::kRemote);
}

void TestWithinSkewHigherVersionWins() {
  const ResolveOptions options{std::chrono::seconds(60)};
  const auto           local  = MakeRecord(PerformanceStatus::kNextOnDeck, 4, std::chrono::seconds(30));
  const auto           remote = MakeRecord(PerformanceStatus::kNextOnStage, 5, std::chrono::milliseconds(0));

  const auto resolution = ConflictResolver::Resolve(local, remote, options);
  assert(resolution.strategy == Strategy::kVersion);
  assert(resolution.winner == Winner::kRemote);
}

void TestTieIsBrokenDeterministically() {
  const auto a = MakeRecord(PerformanceStatus::kCurrentlyOnStage, 3, std::chrono::milliseconds(0));
  const auto b = MakeRecord(PerformanceStatus::kNextOnStage, 3, std::chrono::milliseconds(0));

  const auto resolution = ConflictResolver::Resolve(a, b);
  assert(resolution.strategy == Strategy::kTiebreak);
  assert(resolution.resolved.performance_status == PerformanceStatus::kCurrentlyOnStage);
}

void TestResolveIsCommutative() {
  const ResolveOptions no_skew{};
  const ResolveOptions skew{std::chrono::seconds(60)};

  AssertSamePick(MakeRecord(PerformanceStatus::kNotStarted, 1, std::chrono::milliseconds(0)),
                 MakeRecord(PerformanceStatus::kCompleted, 1, std::chrono::seconds(2)), no_skew);
  AssertSamePick(MakeRecord(PerformanceStatus::kNextOnDeck, 2, std::chrono::seconds(10)),
                 MakeRecord(PerformanceStatus::kNextOnStage, 7, std::chrono::milliseconds(0)), skew);
  AssertSamePick(MakeRecord(PerformanceStatus::kNextOnDeck, 2, std::chrono::milliseconds(0)),
                 MakeRecord(PerformanceStatus::kNextOnStage, 2, std::chrono::milliseconds(0)), no_skew);

  auto with_order    = MakeRecord(PerformanceStatus::kNextOnDeck, 2, std::chrono::milliseconds(0));
  auto without_order = with_order;
  with_order.performance_order = 4;
  AssertSamePick(with_order, without_order, no_skew);
}

void TestIdenticalRecordsHaveNoConflicts() {
  const auto a = MakeRecord(PerformanceStatus::kCompleted, 2, std::chrono::milliseconds(0));

  const auto resolution = ConflictResolver::Resolve(a, a);
  assert(resolution.conflicts.empty());
  assert(ConflictResolver::DescribeConflict(resolution) == "none: tiebreak -> local");
}

void TestDescribeConflictNamesFieldsAndWinner() {
  auto local                = MakeRecord(PerformanceStatus::kNotStarted, 1, std::chrono::milliseconds(0));
  auto remote               = MakeRecord(PerformanceStatus::kCompleted, 1, std::chrono::seconds(5));
  remote.performance_date   = "2024-07-12";

  const auto description = ConflictResolver::DescribeConflict(ConflictResolver::Resolve(local, remote));
  assert(description == "performanceStatus,performanceDate: timestamp -> remote");
}

} // namespace

int main() {
  TestNewerTimestampWinsEvenWithEqualVersion();
  TestNewerTimestampBeatsHigherVersion();
  TestWithinSkewHigherVersionWins();
  TestTieIsBrokenDeterministically();
  TestResolveIsCommutative();
  TestIdenticalRecordsHaveNoConflicts();
  TestDescribeConflictNamesFieldsAndWinner();

  std::cout << "stagesync_unit_conflict_resolver: pass\n";
  return 0;
}
