#include "internal/model/status_record.hpp"

namespace stagesync::model {

std::string_view ToString(PerformanceStatus status) {
  switch (status) {
    case PerformanceStatus::kNotStarted:
      return "not_started";
    case PerformanceStatus::kNextOnDeck:
      return "next_on_deck";
    case PerformanceStatus::kNextOnStage:
      return "next_on_stage";
    case PerformanceStatus::kCurrentlyOnStage:
      return "currently_on_stage";
    case PerformanceStatus::kCompleted:
      return "completed";
  }
  return "not_started";
}

std::optional<PerformanceStatus> ParsePerformanceStatus(std::string_view text) {
  if (text == "not_started") return PerformanceStatus::kNotStarted;
  if (text == "next_on_deck") return PerformanceStatus::kNextOnDeck;
  if (text == "next_on_stage") return PerformanceStatus::kNextOnStage;
  if (text == "currently_on_stage") return PerformanceStatus::kCurrentlyOnStage;
  if (text == "completed") return PerformanceStatus::kCompleted;
  return std::nullopt;
}

void ApplyFields(StatusRecord& record, const StatusPatch& patch) {
  if (patch.performance_status) {
    record.performance_status = *patch.performance_status;
  }

  if (patch.clear_performance_order) {
    record.performance_order.reset();
  } else if (patch.performance_order) {
    record.performance_order = patch.performance_order;
  }

  if (patch.clear_performance_date) {
    record.performance_date.reset();
  } else if (patch.performance_date) {
    record.performance_date = patch.performance_date;
  }
}

StatusPatch PatchFrom(const StatusRecord& record) {
  StatusPatch patch;
  patch.performance_status      = record.performance_status;
  patch.performance_order       = record.performance_order;
  patch.clear_performance_order = !record.performance_order.has_value();
  patch.performance_date        = record.performance_date;
  patch.clear_performance_date  = !record.performance_date.has_value();
  patch.timestamp               = record.timestamp;
  patch.version                 = record.version;
  return patch;
}

bool SameTrackedFields(const StatusRecord& a, const StatusRecord& b) {
  return a.performance_status == b.performance_status && a.performance_order == b.performance_order && a.performance_date == b.performance_date;
}

std::vector<std::string> DiffTrackedFields(const StatusRecord& a, const StatusRecord& b) {
  std::vector<std::string> fields;
  if (a.performance_status != b.performance_status) fields.emplace_back("performanceStatus");
  if (a.performance_order != b.performance_order) fields.emplace_back("performanceOrder");
  if (a.performance_date != b.performance_date) fields.emplace_back("performanceDate");
  return fields;
}

} // namespace stagesync::model
