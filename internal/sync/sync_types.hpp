#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace stagesync::sync {

enum class SyncDirection {
  kBidirectional,
  kRemoteToLocal,
  kLocalToRemote,
};

// Entity classes reconciled by a run; artist status records are the status-bearing registrations.
enum class ItemType {
  kStatus,
  kCounter,
};

enum class ConflictReason {
  kTimestamp,
  kVersion,
  kDataMismatch,
};

enum class ResolutionKind {
  kLocalWins,
  kRemoteWins,
  kManual,
  kMerge,
};

std::string_view ToString(SyncDirection direction);
std::string_view ToString(ItemType type);
std::string_view ToString(ConflictReason reason);
std::string_view ToString(ResolutionKind resolution);

/*
  One reconciled disagreement between the stores. The *_version fields hold
  the JSON document of each side.
*/
struct SyncConflict {
  std::string    item_id;
  ItemType       item_type = ItemType::kStatus;
  std::string    local_version;
  std::string    remote_version;
  ConflictReason conflict_reason = ConflictReason::kDataMismatch;
  ResolutionKind resolution      = ResolutionKind::kLocalWins;
  std::string    resolved_version;
};

struct SyncMetadata {
  util::TimePoint last_sync{};
  std::uint64_t   version        = 0;
  std::uint64_t   total_items    = 0;
  std::uint64_t   conflict_count = 0;
  SyncDirection   sync_direction = SyncDirection::kBidirectional;
};

struct SyncResult {
  bool                      success      = false;
  std::uint64_t             items_synced = 0;
  std::vector<SyncConflict> conflicts;
  std::vector<std::string>  errors;
  std::chrono::milliseconds duration{0};
  SyncMetadata              metadata;
};

} // namespace stagesync::sync
