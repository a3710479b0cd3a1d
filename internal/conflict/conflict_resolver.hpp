#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/status_record.hpp"

namespace stagesync::conflict {

enum class Strategy {
  kTimestamp, // timestamps further apart than the skew: newer wins
  kVersion,   // within the skew: higher version wins
  kTiebreak,  // same version within the skew: deterministic field order
};

enum class Winner {
  kLocal,
  kRemote,
};

std::string_view ToString(Strategy strategy);

struct ResolveOptions {
  std::chrono::milliseconds skew{0};
};

struct Resolution {
  model::StatusRecord      resolved;
  Strategy                 strategy = Strategy::kTimestamp;
  Winner                   winner   = Winner::kLocal;
  std::vector<std::string> conflicts; // differing tracked fields
};

/*
  Last-writer-wins resolution between two versions of the same record.

  The loser is discarded whole; fields are never merged. Resolve(a, b) and
  Resolve(b, a) always pick the same record.
*/
class ConflictResolver {
 public:
  static Resolution Resolve(const model::StatusRecord& local, const model::StatusRecord& remote, const ResolveOptions& options = {});

  static std::vector<std::string> DiffFields(const model::StatusRecord& a, const model::StatusRecord& b);

  // One line for logs and notices: "performanceStatus: timestamp -> remote".
  static std::string DescribeConflict(const Resolution& resolution);
};

} // namespace stagesync::conflict
