#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/status_service.hpp"
#include "stagesync/v1/status_service.grpc.pb.h"

namespace stagesync::grpc {

class StatusServer final : public stagesync::v1::StatusService::Service {
 public:
  explicit StatusServer(std::shared_ptr<stagesync::service::StatusService> svc);

  ::grpc::Status GetArtistStatus(::grpc::ServerContext*, const stagesync::v1::GetArtistStatusRequest*,
                                 stagesync::v1::GetArtistStatusResponse*) override;
  ::grpc::Status UpdateArtistStatus(::grpc::ServerContext*, const stagesync::v1::UpdateArtistStatusRequest*,
                                    stagesync::v1::UpdateArtistStatusResponse*) override;
  ::grpc::Status BatchUpdateStatuses(::grpc::ServerContext*, const stagesync::v1::BatchUpdateStatusesRequest*,
                                     stagesync::v1::BatchUpdateStatusesResponse*) override;
  ::grpc::Status SyncData(::grpc::ServerContext*, const stagesync::v1::SyncDataRequest*, stagesync::v1::SyncDataResponse*) override;
  ::grpc::Status Recover(::grpc::ServerContext*, const stagesync::v1::RecoverRequest*, stagesync::v1::RecoverResponse*) override;
  ::grpc::Status GetStats(::grpc::ServerContext*, const stagesync::v1::GetStatsRequest*, stagesync::v1::GetStatsResponse*) override;

 private:
  std::shared_ptr<stagesync::service::StatusService> service_;
};

} // namespace stagesync::grpc
