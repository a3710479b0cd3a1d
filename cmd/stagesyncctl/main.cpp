#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "stagesync/v1/status_service.grpc.pb.h"

using namespace stagesync::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  stagesyncctl <addr> get <artist_id>\n"
            << "  stagesyncctl <addr> update <artist_id> <status> [order] [priority=low|normal|high]\n"
            << "  stagesyncctl <addr> sync [bidirectional|remote-to-local|local-to-remote]\n"
            << "  stagesyncctl <addr> recover <cache_corruption|network_failure|data_inconsistency|sync_failure> [event_id] [performance_date]\n"
            << "  stagesyncctl <addr> stats\n";
}

static std::optional<UpdatePriority> ParsePriority(const std::string& value) {
  if (value == "low") return UPDATE_PRIORITY_LOW;
  if (value == "normal") return UPDATE_PRIORITY_NORMAL;
  if (value == "high") return UPDATE_PRIORITY_HIGH;
  return std::nullopt;
}

static std::optional<SyncDirection> ParseDirection(const std::string& value) {
  if (value == "bidirectional") return SYNC_DIRECTION_BIDIRECTIONAL;
  if (value == "remote-to-local") return SYNC_DIRECTION_REMOTE_TO_LOCAL;
  if (value == "local-to-remote") return SYNC_DIRECTION_LOCAL_TO_REMOTE;
  return std::nullopt;
}

static void PrintRecord(const StatusDocument& record) {
  std::cout << "artist_id=" << record.artist_id() << " event_id=" << record.event_id() << " status=" << record.performance_status();
  if (record.has_performance_order()) std::cout << " order=" << record.performance_order();
  if (record.has_performance_date()) std::cout << " date=" << record.performance_date();
  std::cout << " version=" << record.version() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = StatusService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetArtistStatusRequest req;
    req.set_artist_id(argv[3]);

    GetArtistStatusResponse resp;
    auto                    status = stub->GetArtistStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.found()) {
      std::cout << "not found\n";
      return 3;
    }
    PrintRecord(resp.record());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "update") {
    if (argc < 5) return 1;

    UpdateArtistStatusRequest req;
    req.set_artist_id(argv[3]);
    req.mutable_updates()->set_performance_status(argv[4]);
    if (argc >= 6) {
      req.mutable_updates()->set_performance_order(std::stoi(argv[5]));
    }
    if (argc >= 7) {
      auto priority = ParsePriority(argv[6]);
      if (!priority) {
        std::cerr << "unsupported priority: " << argv[6] << "\n";
        return 1;
      }
      req.set_priority(*priority);
    }

    UpdateArtistStatusResponse resp;
    auto                       status = stub->UpdateArtistStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.accepted()) {
      std::cout << "rejected: " << resp.error() << "\n";
      return 3;
    }
    std::cout << "update_id=" << resp.update_id() << "\n";
    PrintRecord(resp.record());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sync") {
    SyncDataRequest req;
    if (argc >= 4) {
      auto direction = ParseDirection(argv[3]);
      if (!direction) {
        std::cerr << "unsupported direction: " << argv[3] << "\n";
        return 1;
      }
      req.set_direction(*direction);
    }

    SyncDataResponse resp;
    auto             status = stub->SyncData(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "success=" << (resp.success() ? "true" : "false") << " items_synced=" << resp.items_synced()
              << " conflicts=" << resp.conflicts_size() << " duration_ms=" << resp.duration_ms() << "\n";
    for (const auto& conflict : resp.conflicts()) {
      std::cout << "  " << conflict.item_id() << " " << conflict.conflict_reason() << " -> " << conflict.resolution() << "\n";
    }
    for (const auto& error : resp.errors()) {
      std::cout << "  error: " << error << "\n";
    }
    return resp.success() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "recover") {
    if (argc < 4) return 1;

    RecoverRequest req;
    req.set_type(argv[3]);
    if (argc >= 5) req.set_event_id(argv[4]);
    if (argc >= 6) req.set_performance_date(argv[5]);

    RecoverResponse resp;
    auto            status = stub->Recover(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.success() ? "recovered" : "recovery failed") << "\n";
    return resp.success() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    GetStatsRequest  req;
    GetStatsResponse resp;
    auto             status = stub->GetStats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "state=" << resp.state() << "\n"
              << "cache_entries=" << resp.cache_entries() << " dirty=" << resp.cache_dirty_entries() << " expired=" << resp.cache_expired_entries()
              << " hit_rate=" << resp.cache_hit_rate() << "\n"
              << "queue_size=" << resp.queue_size() << " completed=" << resp.queue_completed() << " failed=" << resp.queue_failed() << "\n"
              << "sync_errors=" << resp.sync_errors() << " total_operations=" << resp.total_operations() << " conflicts=" << resp.conflict_count()
              << "\n"
              << "recoveries=" << resp.recoveries_total() << " successful=" << resp.recoveries_successful() << " failed=" << resp.recoveries_failed()
              << "\n";
    return 0;
  }

  Usage();
  return 1;
}
