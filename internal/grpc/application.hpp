#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/factory.hpp"

namespace stagesync::grpc {

/*
  The daemon's dependency graph: the engine plus the gRPC adapters over it.
*/
struct Application {
  factory::Engine                               engine;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

Application Build(const stagesync::runtime::config::RuntimeConfig& config);

} // namespace stagesync::grpc
