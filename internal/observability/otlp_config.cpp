#include "internal/observability/spans.hpp"

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace stagesync::observability {

OtlpConfig ToOtlpConfig(const stagesync::runtime::config::RuntimeConfig& config) {
  const auto& obs = config.observability();

  OtlpConfig otlp;
  otlp.endpoint        = obs.otlp_endpoint();
  otlp.transport       = obs.transport() == stagesync::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  otlp.export_interval = util::ToMillis(obs.metrics_export_interval(), otlp.export_interval);
  otlp.event_id        = config.event().event_id();
  if (!obs.service_name().empty()) otlp.service_name = obs.service_name();
  return otlp;
}

} // namespace stagesync::observability
