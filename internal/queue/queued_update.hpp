#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/status_record.hpp"
#include "internal/util/time.hpp"

namespace stagesync::queue {

enum class UpdatePriority : std::uint8_t {
  kLow    = 0,
  kNormal = 1,
  kHigh   = 2,
};

std::string_view ToString(UpdatePriority priority);

// Live-show transitions jump the queue; anything else can wait.
UpdatePriority PriorityFor(model::PerformanceStatus status);

/*
  A pending durable write.

  max_retries == 0 takes the queue default on Enqueue.
*/
struct QueuedUpdate {
  std::string        id;
  std::string        artist_id;
  std::string        event_id;
  model::StatusPatch updates;
  UpdatePriority     priority = UpdatePriority::kNormal;

  std::uint32_t                  retry_count = 0;
  std::uint32_t                  max_retries = 0;
  std::optional<util::TimePoint> next_retry_at;
  util::TimePoint                enqueued_at{};
  std::string                    last_error;
};

} // namespace stagesync::queue
