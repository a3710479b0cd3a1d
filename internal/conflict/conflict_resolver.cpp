#include "internal/conflict/conflict_resolver.hpp"

#include <sstream>

namespace stagesync::conflict {

std::string_view ToString(Strategy strategy) {
  switch (strategy) {
    case Strategy::kTimestamp:
      return "timestamp";
    case Strategy::kVersion:
      return "version";
    case Strategy::kTiebreak:
      return "tiebreak";
  }
  return "timestamp";
}

namespace {

// Strict total order over the tracked content of two same-version records.
// Returns >0 when a should win, <0 when b should, 0 when indistinguishable.
int CompareForTiebreak(const model::StatusRecord& a, const model::StatusRecord& b) {
  if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp ? 1 : -1;

  const auto rank_a = model::ProgressRank(a.performance_status);
  const auto rank_b = model::ProgressRank(b.performance_status);
  if (rank_a != rank_b) return rank_a > rank_b ? 1 : -1;

  // A set order beats an unset one, then the larger wins.
  if (a.performance_order != b.performance_order) return a.performance_order > b.performance_order ? 1 : -1;
  if (a.performance_date != b.performance_date) return a.performance_date > b.performance_date ? 1 : -1;

  return 0;
}

} // namespace

Resolution ConflictResolver::Resolve(const model::StatusRecord& local, const model::StatusRecord& remote, const ResolveOptions& options) {
  Resolution result;
  result.conflicts = DiffFields(local, remote);

  const auto delta = local.timestamp > remote.timestamp ? local.timestamp - remote.timestamp : remote.timestamp - local.timestamp;

  if (delta > options.skew) {
    result.strategy = Strategy::kTimestamp;
    result.winner   = local.timestamp > remote.timestamp ? Winner::kLocal : Winner::kRemote;
  } else if (local.version != remote.version) {
    result.strategy = Strategy::kVersion;
    result.winner   = local.version > remote.version ? Winner::kLocal : Winner::kRemote;
  } else {
    result.strategy = Strategy::kTiebreak;
    result.winner   = CompareForTiebreak(local, remote) >= 0 ? Winner::kLocal : Winner::kRemote;
  }

  result.resolved = result.winner == Winner::kLocal ? local : remote;
  return result;
}

std::vector<std::string> ConflictResolver::DiffFields(const model::StatusRecord& a, const model::StatusRecord& b) {
  return model::DiffTrackedFields(a, b);
}

std::string ConflictResolver::DescribeConflict(const Resolution& resolution) {
  std::ostringstream out;
  for (std::size_t i = 0; i < resolution.conflicts.size(); ++i) {
    if (i > 0) out << ',';
    out << resolution.conflicts[i];
  }
  if (resolution.conflicts.empty()) out << "none";
  out << ": " << ToString(resolution.strategy) << " -> " << (resolution.winner == Winner::kLocal ? "local" : "remote");
  return out.str();
}

} // namespace stagesync::conflict
