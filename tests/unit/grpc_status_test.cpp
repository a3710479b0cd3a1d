#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/cache_manager.hpp"
#include "internal/core/durable_status_writer.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/status_server.hpp"
#include "internal/notify/local_change_channel.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/memory_document_store.hpp"

namespace {

stagesync::service::ServiceContext BuildServiceContext() {
  auto clock   = std::make_shared<stagesync::util::ManualClock>();
  auto durable = std::make_shared<stagesync::store::StatusRepository>(std::make_shared<stagesync::store::MemoryDocumentStore>());
  auto cache   = std::make_shared<stagesync::cache::StatusCache>(stagesync::cache::CacheOptions{}, clock);
  auto queue   = std::make_shared<stagesync::queue::UpdateQueue>(stagesync::queue::QueueOptions{},
                                                                 std::make_shared<stagesync::core::DurableStatusWriter>(durable), clock);

  stagesync::core::CacheManagerOptions options;
  options.start_background_tasks = false;

  stagesync::service::ServiceContext ctx;
  ctx.manager = std::make_shared<stagesync::core::CacheManager>(cache, queue, durable, std::make_shared<stagesync::notify::LocalChangeChannel>(),
                                                                options, clock);
  return ctx;
}

void TestUpdateOnReadyManagerReturnsOk() {
  auto ctx = BuildServiceContext();
  ctx.manager->Initialize("fest");
  stagesync::grpc::StatusServer server(std::make_shared<stagesync::service::StatusService>(ctx));

  stagesync::v1::UpdateArtistStatusRequest req;
  req.set_artist_id("a");
  req.mutable_updates()->set_performance_status("next_on_deck");
  stagesync::v1::UpdateArtistStatusResponse resp;
  ::grpc::ServerContext                     grpc_ctx;

  const auto status = server.UpdateArtistStatus(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.accepted());
}

void TestMissingArtistIdReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  ctx.manager->Initialize("fest");
  stagesync::grpc::StatusServer server(std::make_shared<stagesync::service::StatusService>(ctx));

  stagesync::v1::GetArtistStatusRequest  req;
  stagesync::v1::GetArtistStatusResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server.GetArtistStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnknownStatusReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  ctx.manager->Initialize("fest");
  stagesync::grpc::StatusServer server(std::make_shared<stagesync::service::StatusService>(ctx));

  stagesync::v1::UpdateArtistStatusRequest req;
  req.set_artist_id("a");
  req.mutable_updates()->set_performance_status("encore");
  stagesync::v1::UpdateArtistStatusResponse resp;
  ::grpc::ServerContext                     grpc_ctx;

  const auto status = server.UpdateArtistStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUninitializedManagerReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  stagesync::grpc::StatusServer server(std::make_shared<stagesync::service::StatusService>(ctx));

  stagesync::v1::GetArtistStatusRequest req;
  req.set_artist_id("a");
  stagesync::v1::GetArtistStatusResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server.GetArtistStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestRecoverWithoutRecoveryServiceReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  ctx.manager->Initialize("fest");
  stagesync::grpc::StatusServer server(std::make_shared<stagesync::service::StatusService>(ctx));

  stagesync::v1::RecoverRequest req;
  req.set_type("sync_failure");
  stagesync::v1::RecoverResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server.Recover(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestExceptionMapping() {
  using stagesync::grpc::ToStatus;
  assert(ToStatus(stagesync::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(stagesync::util::SyncInProgress("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(stagesync::util::StoreUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(stagesync::util::ConnectivityTimeout("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

} // namespace

int main() {
  TestUpdateOnReadyManagerReturnsOk();
  TestMissingArtistIdReturnsInvalidArgument();
  TestUnknownStatusReturnsInvalidArgument();
  TestUninitializedManagerReturnsFailedPrecondition();
  TestRecoverWithoutRecoveryServiceReturnsFailedPrecondition();
  TestExceptionMapping();

  std::cout << "stagesync_unit_grpc_status: pass\n";
  return 0;
}
