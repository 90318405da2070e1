#include "internal/observability/spans.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace checkout::observability {

OtlpConfig ToOtlpConfig(const checkout::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint = observability.otlp_endpoint();
  otlp.transport =
      observability.transport() == checkout::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_export_interval_ms() > 0) {
    otlp.export_interval_ms = observability.metrics_export_interval_ms();
  }
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const bool  traces     = signal == OtlpSignal::kTraces;
  const char* signal_env = traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  for (const char* name : {signal_env, "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
      return value;
    }
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  }
  return "localhost:4317";
}

} // namespace checkout::observability
