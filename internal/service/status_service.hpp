#pragma once

#include <string_view>

#include "service_context.hpp"
#include "stagesync/v1/status_service.pb.h"

namespace stagesync::service {

/*
  Transport-neutral handlers behind the gRPC StatusService. Requests are
  validated here; engine exceptions propagate to the adapter.
*/
class StatusService {
 public:
  explicit StatusService(ServiceContext ctx);

  stagesync::v1::GetArtistStatusResponse     GetArtistStatus(const stagesync::v1::GetArtistStatusRequest& req);
  stagesync::v1::UpdateArtistStatusResponse  UpdateArtistStatus(const stagesync::v1::UpdateArtistStatusRequest& req);
  stagesync::v1::BatchUpdateStatusesResponse BatchUpdateStatuses(const stagesync::v1::BatchUpdateStatusesRequest& req);
  stagesync::v1::SyncDataResponse            SyncData(const stagesync::v1::SyncDataRequest& req);
  stagesync::v1::RecoverResponse             Recover(const stagesync::v1::RecoverRequest& req);
  stagesync::v1::GetStatsResponse            GetStats(const stagesync::v1::GetStatsRequest& req);

 private:
  template <typename Fn>
  auto Handle(std::string_view route, Fn&& fn) -> decltype(fn());

  ServiceContext ctx_;
};

} // namespace stagesync::service
