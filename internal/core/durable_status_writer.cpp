#include "internal/core/durable_status_writer.hpp"

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace stagesync::core {

DurableStatusWriter::DurableStatusWriter(std::shared_ptr<store::StatusRepository> durable) : durable_(std::move(durable)) {
  if (!durable_) {
    throw std::invalid_argument("DurableStatusWriter requires a repository");
  }
}

model::StatusRecord DurableStatusWriter::Write(const queue::QueuedUpdate& update) {
  if (update.event_id.empty() || update.artist_id.empty()) {
    throw util::InvalidArgument("queued update " + update.id + " is missing its event or artist id");
  }

  observability::SpanScope span("DurableStatusWriter.Write");
  span.SetAttribute("artist_id", update.artist_id);

  return durable_->MergePatch(update.event_id, update.artist_id, update.updates);
}

} // namespace stagesync::core
