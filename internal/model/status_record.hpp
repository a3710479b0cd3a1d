#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace stagesync::model {

// Ordered by show progress; the numeric value is the progress rank.
enum class PerformanceStatus : std::uint8_t {
  kNotStarted       = 0,
  kNextOnDeck       = 1,
  kNextOnStage      = 2,
  kCurrentlyOnStage = 3,
  kCompleted        = 4,
};

constexpr std::uint8_t ProgressRank(PerformanceStatus status) {
  return static_cast<std::uint8_t>(status);
}

std::string_view                 ToString(PerformanceStatus status);
std::optional<PerformanceStatus> ParsePerformanceStatus(std::string_view text);

/*
  StatusRecord

  One authoritative record per (artist_id, event_id) per store. version only
  moves forward for accepted writes; dirty stays set until the record has been
  durably persisted.
*/
struct StatusRecord {
  std::string artist_id;
  std::string event_id;

  PerformanceStatus          performance_status = PerformanceStatus::kNotStarted;
  std::optional<int32_t>     performance_order;
  std::optional<std::string> performance_date;

  util::TimePoint timestamp{};
  std::uint64_t   version = 0;
  bool            dirty   = false;
};

/*
  StatusPatch

  Partial update. Unset fields are left alone; the clear_* flags null out the
  nullable fields explicitly.
*/
struct StatusPatch {
  std::optional<PerformanceStatus> performance_status;
  std::optional<int32_t>           performance_order;
  bool                             clear_performance_order = false;
  std::optional<std::string>       performance_date;
  bool                             clear_performance_date = false;

  std::optional<util::TimePoint> timestamp;
  std::optional<std::uint64_t>   version;
};

// Field-level merge; leaves version, timestamp and dirty untouched.
void ApplyFields(StatusRecord& record, const StatusPatch& patch);

// Patch that reproduces every tracked field of record, including its version.
StatusPatch PatchFrom(const StatusRecord& record);

// Tracked fields: status, order, date.
bool                     SameTrackedFields(const StatusRecord& a, const StatusRecord& b);
std::vector<std::string> DiffTrackedFields(const StatusRecord& a, const StatusRecord& b);

} // namespace stagesync::model
