#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
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

#include <atomic>
#include <chrono>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_target.hpp"

namespace dispatch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using Attribute = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char*               kServiceName           = "rider-dispatch";
constexpr std::chrono::milliseconds kDefaultExportInterval = std::chrono::seconds(10);

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Views over the caller's strings, which outlive the recording call.
opentelemetry::nostd::string_view View(std::string_view value) {
  return {value.data(), value.size()};
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint = target.endpoint;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto target   = ResolveOtlpTarget(observability, OtlpSignal::kMetrics);
  const auto interval = observability.metrics_export_interval_ms() > 0 ? std::chrono::milliseconds(observability.metrics_export_interval_ms())
                                                                        : kDefaultExportInterval;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
  // the exporter must finish before the next collection starts
  reader_options.export_timeout_millis = interval / 2;

  resource::ResourceAttributes attributes = {{"service.name", kServiceName}, {"service.instance.id", config.server().node_id()}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attributes));
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(target), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  DISPATCH_LOG_INFO("Metrics enabled", {StringField("endpoint", target.endpoint), IntField("export_interval_ms", interval.count())});
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// ------------------------------------------------------------------
// Instruments
// ------------------------------------------------------------------

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> bus_messages;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      settlement_amount;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   live_connections_gauge;

  std::atomic<std::int64_t> live_connections{0};
};

// Instruments bind to whichever provider is installed on first use, so
// InitializeMetrics() runs before anything records.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName);

  impl_->requests           = impl_->meter->CreateUInt64Counter("dispatch.request.count", "Dispatch RPCs handled", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("dispatch.request.latency_ms", "Dispatch RPC latency", "ms");
  impl_->bus_messages       = impl_->meter->CreateUInt64Counter("dispatch.bus.messages", "Bus messages consumed", "1");
  impl_->settlement_amount  = impl_->meter->CreateDoubleHistogram("dispatch.settlement.amount", "Fee shares settled per delivery", "1");

  impl_->live_connections_gauge = impl_->meter->CreateInt64ObservableGauge("dispatch.connections.live", "Registered rider and customer streams", "1");
  impl_->live_connections_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl     = static_cast<Impl*>(state);
        auto  observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        observer->Observe(impl->live_connections.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::initializer_list<Attribute> attributes = {{"route", View(route)}, {"success", success}};
  impl_->requests->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::initializer_list<Attribute> attributes = {{"route", View(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordBusMessage(std::string_view exchange, bool success) {
  const std::initializer_list<Attribute> attributes = {{"exchange", View(exchange)}, {"success", success}};
  impl_->bus_messages->Add(1, attributes);
}

void Metrics::ObserveSettlementAmount(std::string_view kind, double amount) {
  const std::initializer_list<Attribute> attributes = {{"kind", View(kind)}};
  impl_->settlement_amount->Record(amount, attributes, opentelemetry::context::Context{});
}

void Metrics::SetLiveConnections(std::int64_t count) {
  impl_->live_connections.store(count);
}

} // namespace dispatch::observability

#endif
