#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace stagesync::runtime::config {
class RuntimeConfig;
}

namespace stagesync::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string               service_name{"stagesync"};
  std::string               endpoint{};
  OtlpTransport             transport{OtlpTransport::kGrpc};
  bool                      insecure{true};
  std::chrono::milliseconds export_interval{1000};
  // Attached to the exported resource so traces from different shows can be told apart.
  std::string               event_id{};
};

// Empty endpoint falls back to OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT.
OtlpConfig ToOtlpConfig(const stagesync::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const stagesync::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const stagesync::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordCacheLookup(bool hit);
  void RecordStatusWrite(bool accepted);
  void RecordQueueOutcome(std::string_view outcome, std::uint64_t count);
  void SetQueueDepth(std::uint64_t depth);
  void ObserveSyncDurationMs(std::string_view direction, bool success, double duration_ms);
  void RecordRecovery(std::string_view type, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const stagesync::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const stagesync::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordCacheLookup(bool) {
}

inline void Metrics::RecordStatusWrite(bool) {
}

inline void Metrics::RecordQueueOutcome(std::string_view, std::uint64_t) {
}

inline void Metrics::SetQueueDepth(std::uint64_t) {
}

inline void Metrics::ObserveSyncDurationMs(std::string_view, bool, double) {
}

inline void Metrics::RecordRecovery(std::string_view, bool) {
}
#endif

} // namespace stagesync::observability
