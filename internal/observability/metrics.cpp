#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/key_value_iterable_view.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace stagesync::observability {

namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

template <typename T>
using Instrument = opentelemetry::nostd::shared_ptr<T>;

// Attribute values are owned here; the SDK only sees views of them.
using Labels = std::map<std::string, std::string>;

namespace {

std::mutex                                 g_provider_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string MetricsEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;
  for (const char* var : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(var)) return value;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& config) {
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricsEndpoint(config);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricsEndpoint(config);
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

const char* Flag(bool value) {
  return value ? "true" : "false";
}

void Add(const Instrument<metrics_api::Counter<std::uint64_t>>& counter, std::uint64_t value, const Labels& labels) {
  if (!counter || value == 0) return;
  counter->Add(value, opentelemetry::common::KeyValueIterableView<Labels>(labels));
}

void Record(const Instrument<metrics_api::Histogram<double>>& histogram, double value, const Labels& labels) {
  if (!histogram) return;
  histogram->Record(value, opentelemetry::common::KeyValueIterableView<Labels>(labels), opentelemetry::context::Context{});
}

} // namespace

bool InitializeMetrics(const OtlpConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = config.export_interval;
  reader_options.export_timeout_millis  = std::min(config.export_interval, reader_options.export_timeout_millis);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(config), reader_options);

  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", config.service_name}, {"service.version", "0.1.0"}};
  if (!config.event_id.empty()) attributes.SetAttribute("stagesync.event_id", config.event_id);

  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                              opentelemetry::sdk::resource::Resource::Create(attributes));
  provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(provider));

  std::lock_guard lock(g_provider_mutex);
  g_provider = std::move(provider);
  return true;
}

bool InitializeMetrics(const stagesync::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }
  return InitializeMetrics(ToOtlpConfig(config));
}

void ShutdownMetrics() {
  std::shared_ptr<sdkmetrics::MeterProvider> provider;
  {
    std::lock_guard lock(g_provider_mutex);
    provider = std::move(g_provider);
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

// ------------------------------------------------------------
// Instruments
// ------------------------------------------------------------

struct Metrics::Impl {
  Instrument<metrics_api::Meter> meter;

  Instrument<metrics_api::Counter<std::uint64_t>> requests;
  Instrument<metrics_api::Histogram<double>>      request_latency_ms;
  Instrument<metrics_api::Counter<std::uint64_t>> cache_lookups;
  Instrument<metrics_api::Counter<std::uint64_t>> status_writes;
  Instrument<metrics_api::Counter<std::uint64_t>> queue_outcomes;
  Instrument<metrics_api::Histogram<double>>      sync_duration_ms;
  Instrument<metrics_api::Counter<std::uint64_t>> recoveries;
  Instrument<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::atomic<std::int64_t> queue_depth{0};

  static void ObserveQueueDepth(metrics_api::ObserverResult result, void* state) {
    auto* self     = static_cast<Impl*>(state);
    auto  observer = opentelemetry::nostd::get<Instrument<metrics_api::ObserverResultT<std::int64_t>>>(result);
    observer->Observe(self->queue_depth.load());
  }
};

// Instruments bind to whichever provider is global at first use, so
// InitializeMetrics must run before the first Instance() call to export anything.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("stagesync", "0.1.0");
  auto& meter  = impl_->meter;

  impl_->requests           = meter->CreateUInt64Counter("stagesync.request.count", "Control requests by route and result", "1");
  impl_->request_latency_ms = meter->CreateDoubleHistogram("stagesync.request.latency_ms", "Control request latency", "ms");
  impl_->cache_lookups      = meter->CreateUInt64Counter("stagesync.cache.lookups", "Status cache lookups by result", "1");
  impl_->status_writes      = meter->CreateUInt64Counter("stagesync.status.writes", "Status writes by acceptance", "1");
  impl_->queue_outcomes     = meter->CreateUInt64Counter("stagesync.queue.outcomes", "Write-behind queue entry outcomes", "1");
  impl_->sync_duration_ms   = meter->CreateDoubleHistogram("stagesync.sync.duration_ms", "Store reconciliation duration", "ms");
  impl_->recoveries         = meter->CreateUInt64Counter("stagesync.recovery.count", "Recovery procedures by type and result", "1");
  impl_->queue_depth_gauge  = meter->CreateInt64ObservableGauge("stagesync.queue.depth", "Pending write-behind updates", "1");
  impl_->queue_depth_gauge->AddCallback(&Impl::ObserveQueueDepth, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Add(impl_->requests, 1, {{"route", std::string(route)}, {"success", Flag(success)}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Record(impl_->request_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::RecordCacheLookup(bool hit) {
  Add(impl_->cache_lookups, 1, {{"result", hit ? "hit" : "miss"}});
}

void Metrics::RecordStatusWrite(bool accepted) {
  Add(impl_->status_writes, 1, {{"accepted", Flag(accepted)}});
}

void Metrics::RecordQueueOutcome(std::string_view outcome, std::uint64_t count) {
  Add(impl_->queue_outcomes, count, {{"outcome", std::string(outcome)}});
}

void Metrics::SetQueueDepth(std::uint64_t depth) {
  impl_->queue_depth = static_cast<std::int64_t>(depth);
}

void Metrics::ObserveSyncDurationMs(std::string_view direction, bool success, double duration_ms) {
  Record(impl_->sync_duration_ms, duration_ms, {{"direction", std::string(direction)}, {"success", Flag(success)}});
}

void Metrics::RecordRecovery(std::string_view type, bool success) {
  Add(impl_->recoveries, 1, {{"type", std::string(type)}, {"success", Flag(success)}});
}

} // namespace stagesync::observability

#endif
