#include "status_service.hpp"

#include <chrono>
#include <optional>

#include "internal/core/cache_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/recovery/recovery_service.hpp"
#include "internal/store/status_codec.hpp"
#include "internal/sync/sync_service.hpp"
#include "internal/util/errors.hpp"

namespace stagesync::service {

using namespace stagesync::v1;

namespace {

std::optional<queue::UpdatePriority> FromProto(UpdatePriority priority) {
  switch (priority) {
    case UPDATE_PRIORITY_LOW:
      return queue::UpdatePriority::kLow;
    case UPDATE_PRIORITY_NORMAL:
      return queue::UpdatePriority::kNormal;
    case UPDATE_PRIORITY_HIGH:
      return queue::UpdatePriority::kHigh;
    default:
      return std::nullopt;
  }
}

UpdateArtistStatusResponse ToResponse(const core::WriteResult& result) {
  UpdateArtistStatusResponse resp;
  resp.set_accepted(result.accepted);
  resp.set_artist_id(result.artist_id);
  resp.set_update_id(result.update_id);
  resp.set_error(result.error);
  if (result.record) {
    *resp.mutable_record() = store::ToDocument(*result.record);
  }
  return resp;
}

SyncMetadataDocument ToDocument(const sync::SyncMetadata& metadata) {
  SyncMetadataDocument doc;
  *doc.mutable_last_sync() = util::ToProto(metadata.last_sync);
  doc.set_version(metadata.version);
  doc.set_total_items(metadata.total_items);
  doc.set_conflict_count(metadata.conflict_count);
  doc.set_sync_direction(std::string(sync::ToString(metadata.sync_direction)));
  return doc;
}

std::optional<std::string> OptionalText(const std::string& text) {
  if (text.empty()) return std::nullopt;
  return text;
}

} // namespace

StatusService::StatusService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto StatusService::Handle(std::string_view route, Fn&& fn) -> decltype(fn()) {
  observability::SpanScope span(route);
  const auto               started_at = std::chrono::steady_clock::now();
  auto                     elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto resp = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    STAGESYNC_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

GetArtistStatusResponse StatusService::GetArtistStatus(const GetArtistStatusRequest& req) {
  return Handle("StatusService.GetArtistStatus", [&] {
    if (req.artist_id().empty()) throw util::InvalidArgument("artist_id is required");

    GetArtistStatusResponse resp;
    if (auto record = ctx_.manager->GetArtistStatus(req.artist_id())) {
      resp.set_found(true);
      *resp.mutable_record() = store::ToDocument(*record);
    }
    return resp;
  });
}

UpdateArtistStatusResponse StatusService::UpdateArtistStatus(const UpdateArtistStatusRequest& req) {
  return Handle("StatusService.UpdateArtistStatus", [&] {
    if (req.artist_id().empty()) throw util::InvalidArgument("artist_id is required");

    auto patch = store::FromDocument(req.updates());
    return ToResponse(ctx_.manager->UpdateArtistStatus(req.artist_id(), patch, FromProto(req.priority())));
  });
}

BatchUpdateStatusesResponse StatusService::BatchUpdateStatuses(const BatchUpdateStatusesRequest& req) {
  return Handle("StatusService.BatchUpdateStatuses", [&] {
    std::vector<core::BatchItem> items;
    items.reserve(req.items_size());
    for (const auto& item : req.items()) {
      items.push_back({item.artist_id(), store::FromDocument(item.updates()), FromProto(item.priority())});
    }

    BatchUpdateStatusesResponse resp;
    for (const auto& result : ctx_.manager->BatchUpdateStatuses(items)) {
      *resp.add_results() = ToResponse(result);
    }
    return resp;
  });
}

SyncDataResponse StatusService::SyncData(const SyncDataRequest& req) {
  return Handle("StatusService.SyncData", [&] {
    if (!ctx_.sync) throw util::InvalidState("sync service is not configured");

    sync::SyncResult result;
    switch (req.direction()) {
      case SYNC_DIRECTION_REMOTE_TO_LOCAL:
        result = ctx_.sync->SyncFromRemoteToLocal();
        break;
      case SYNC_DIRECTION_LOCAL_TO_REMOTE:
        result = ctx_.sync->SyncFromLocalToRemote();
        break;
      default:
        result = ctx_.sync->SyncData();
        break;
    }

    SyncDataResponse resp;
    resp.set_success(result.success);
    resp.set_items_synced(result.items_synced);
    resp.set_duration_ms(static_cast<uint64_t>(result.duration.count()));
    for (const auto& conflict : result.conflicts) {
      auto* doc = resp.add_conflicts();
      doc->set_item_id(conflict.item_id);
      doc->set_item_type(std::string(sync::ToString(conflict.item_type)));
      doc->set_conflict_reason(std::string(sync::ToString(conflict.conflict_reason)));
      doc->set_resolution(std::string(sync::ToString(conflict.resolution)));
      doc->set_local_version(conflict.local_version);
      doc->set_remote_version(conflict.remote_version);
      doc->set_resolved_version(conflict.resolved_version);
    }
    for (const auto& error : result.errors) {
      resp.add_errors(error);
    }
    *resp.mutable_metadata() = ToDocument(result.metadata);
    return resp;
  });
}

RecoverResponse StatusService::Recover(const RecoverRequest& req) {
  return Handle("StatusService.Recover", [&] {
    if (!ctx_.recovery) throw util::InvalidState("recovery service is not configured");

    auto type = recovery::ParseRecoveryType(req.type());
    if (!type) throw util::InvalidArgument("unknown recovery type: " + req.type());

    const auto event_id = req.event_id().empty() ? ctx_.manager->EventId() : req.event_id();
    if (event_id.empty()) throw util::InvalidArgument("event_id is required");

    recovery::RecoveryContext context;
    context.artist_ids.assign(req.artist_ids().begin(), req.artist_ids().end());

    RecoverResponse resp;
    resp.set_success(ctx_.recovery->AutoRecover(*type, event_id, OptionalText(req.performance_date()), context));
    return resp;
  });
}

GetStatsResponse StatusService::GetStats(const GetStatsRequest&) {
  return Handle("StatusService.GetStats", [&] {
    const auto stats = ctx_.manager->GetStats();

    GetStatsResponse resp;
    resp.set_cache_entries(stats.cache.total_entries);
    resp.set_cache_dirty_entries(stats.cache.dirty_entries);
    resp.set_cache_expired_entries(stats.cache.expired_entries);
    resp.set_cache_hit_rate(stats.cache.hit_rate);
    resp.set_queue_size(stats.queue.total_queued + stats.queue.processing);
    resp.set_queue_total_queued(stats.queue.total_queued);
    resp.set_queue_completed(stats.queue.completed);
    resp.set_queue_failed(stats.queue.failed);
    resp.set_sync_errors(stats.sync_errors);
    resp.set_total_operations(stats.total_operations);
    if (stats.last_sync_time) {
      *resp.mutable_last_sync_time() = util::ToProto(*stats.last_sync_time);
    }
    resp.set_conflict_count(stats.conflicts);
    resp.set_state(std::string(core::ToString(stats.state)));

    if (ctx_.recovery) {
      const auto recovery = ctx_.recovery->GetRecoveryStats();
      resp.set_recoveries_total(recovery.total_operations);
      resp.set_recoveries_successful(recovery.successful_recoveries);
      resp.set_recoveries_failed(recovery.failed_recoveries);
    }
    return resp;
  });
}

} // namespace stagesync::service
