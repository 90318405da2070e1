#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace checkout::runtime::config {
class RuntimeConfig;
}

namespace checkout::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"checkout-manager"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

OtlpConfig ToOtlpConfig(const checkout::runtime::config::RuntimeConfig& config);

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Configured endpoint, else OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, else
// OTEL_EXPORTER_OTLP_ENDPOINT, else the collector default for the transport.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal);

bool InitializeTracing(const checkout::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const checkout::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span; becomes the active span for the current thread until
  destroyed. A no-op unless built with ENABLE_OTEL and tracing enabled.
*/
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

  // outcome: "committed" or "rejected"
  void RecordCheckout(std::string_view outcome);

  // outcome: "applied", "ignored", "expired", "cancelled"
  void RecordSettlement(std::string_view outcome);

  void RecordJobRun(std::string_view type, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const checkout::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const checkout::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordCheckout(std::string_view) {
}

inline void Metrics::RecordSettlement(std::string_view) {
}

inline void Metrics::RecordJobRun(std::string_view, bool) {
}
#endif

} // namespace checkout::observability
