#include "application.hpp"

#include "internal/grpc/status_server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/status_service.hpp"

namespace stagesync::grpc {

Application Build(const stagesync::runtime::config::RuntimeConfig& config) {
  Application app;
  app.engine = factory::BuildEngine(config);

  service::ServiceContext ctx;
  ctx.manager  = app.engine.manager;
  ctx.sync     = app.engine.sync;
  ctx.recovery = app.engine.recovery;

  auto status_service = std::make_shared<service::StatusService>(ctx);
  app.grpc_services.push_back(std::make_unique<StatusServer>(status_service));
  return app;
}

} // namespace stagesync::grpc
