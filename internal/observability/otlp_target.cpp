#include "internal/observability/otlp_target.hpp"

#include <cstdlib>
#include <string_view>
#include <utility>

#include "config/config.pb.h"

namespace dispatch::observability {
namespace {

const char* SignalEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string_view SignalPath(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "/v1/traces" : "/v1/metrics";
}

std::string WithSignalPath(std::string base, OtlpSignal signal) {
  const auto path = SignalPath(signal);
  if (base.size() >= path.size() && base.compare(base.size() - path.size(), path.size(), path) == 0) return base;

  while (!base.empty() && base.back() == '/') base.pop_back();
  base.append(path);
  return base;
}

const char* NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

} // namespace

OtlpTarget ResolveOtlpTarget(const dispatch::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  OtlpTarget target;
  target.http = config.transport() == dispatch::runtime::config::OTLP_TRANSPORT_HTTP;

  std::string base;
  if (!config.otlp_endpoint().empty()) {
    base = config.otlp_endpoint();
  } else if (const char* endpoint = NonEmptyEnv(SignalEnv(signal))) {
    target.endpoint = endpoint;
    return target;
  } else if (const char* endpoint = NonEmptyEnv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    base = endpoint;
  } else {
    base = target.http ? "http://localhost:4318" : "localhost:4317";
  }

  target.endpoint = target.http ? WithSignalPath(std::move(base), signal) : std::move(base);
  return target;
}

} // namespace dispatch::observability
