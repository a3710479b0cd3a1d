#pragma once

#include <memory>

#include "internal/queue/update_queue.hpp"
#include "internal/store/status_repository.hpp"

namespace stagesync::core {

/*
  Queue writer that merges each queued patch into the durable store.
  A durable record carrying a newer version is left untouched and returned.
*/
class DurableStatusWriter final : public queue::StatusWriter {
 public:
  explicit DurableStatusWriter(std::shared_ptr<store::StatusRepository> durable);

  model::StatusRecord Write(const queue::QueuedUpdate& update) override;

 private:
  std::shared_ptr<store::StatusRepository> durable_;
};

} // namespace stagesync::core
