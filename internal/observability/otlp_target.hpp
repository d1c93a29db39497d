#pragma once

#include <string>

namespace dispatch::runtime::config {
class ObservabilityConfig;
}

namespace dispatch::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpTarget {
  std::string endpoint;
  bool        http = false;
};

/*
  Where one signal is exported.

  Precedence: observability.otlp_endpoint, then
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT (used verbatim), then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector's default port. Over
  HTTP a base endpoint gets the signal path (/v1/traces, /v1/metrics)
  appended.
*/
OtlpTarget ResolveOtlpTarget(const dispatch::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

} // namespace dispatch::observability
