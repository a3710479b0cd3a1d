#include "status_server.hpp"

#include "grpc_error.hpp"

namespace stagesync::grpc {

using namespace stagesync::v1;

StatusServer::StatusServer(std::shared_ptr<stagesync::service::StatusService> svc) : service_(std::move(svc)) {
}

::grpc::Status StatusServer::GetArtistStatus(::grpc::ServerContext*, const GetArtistStatusRequest* req, GetArtistStatusResponse* resp) {
  try {
    *resp = service_->GetArtistStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::UpdateArtistStatus(::grpc::ServerContext*, const UpdateArtistStatusRequest* req, UpdateArtistStatusResponse* resp) {
  try {
    *resp = service_->UpdateArtistStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::BatchUpdateStatuses(::grpc::ServerContext*, const BatchUpdateStatusesRequest* req, BatchUpdateStatusesResponse* resp) {
  try {
    *resp = service_->BatchUpdateStatuses(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::SyncData(::grpc::ServerContext*, const SyncDataRequest* req, SyncDataResponse* resp) {
  try {
    *resp = service_->SyncData(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::Recover(::grpc::ServerContext*, const RecoverRequest* req, RecoverResponse* resp) {
  try {
    *resp = service_->Recover(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::GetStats(::grpc::ServerContext*, const GetStatsRequest* req, GetStatsResponse* resp) {
  try {
    *resp = service_->GetStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace stagesync::grpc
