#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>
#include <opentelemetry/trace/tracer.h>

#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_target.hpp"

namespace dispatch::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kServiceName = "rider-dispatch";

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = target.endpoint;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Root spans are sampled by ratio; children follow their parent.
std::unique_ptr<sdktrace::Sampler> MakeSampler(double ratio) {
  if (ratio <= 0.0 || ratio >= 1.0) return sdktrace::AlwaysOnSamplerFactory::Create();
  return sdktrace::ParentBasedSamplerFactory::Create(std::shared_ptr<sdktrace::Sampler>(sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio)));
}

} // namespace

bool InitializeTracing(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto target = ResolveOtlpTarget(observability, OtlpSignal::kTraces);

  resource::ResourceAttributes attributes = {{"service.name", kServiceName}, {"service.instance.id", config.server().node_id()}};
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(target), sdktrace::BatchSpanProcessorOptions{});
  g_provider     = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(
      std::move(processor), resource::Resource::Create(attributes), MakeSampler(observability.trace_sample_ratio())));

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kServiceName);

  DISPATCH_LOG_INFO("Tracing enabled", {StringField("endpoint", target.endpoint), DoubleField("sample_ratio", observability.trace_sample_ratio())});
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

// ------------------------------------------------------------------
// SpanScope
// ------------------------------------------------------------------

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name, std::initializer_list<LogField> attributes) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) return;

  impl_->span = g_tracer->StartSpan(std::string(name));
  for (const auto& field : attributes) SetAttribute(field);
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_->span) impl_->span->End();
}

void SpanScope::SetAttribute(const LogField& field) {
  if (impl_->span) impl_->span->SetAttribute("dispatch." + field.key, field.value);
}

void SpanScope::RecordError(std::string_view what) {
  if (!impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(what)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(what));
}

} // namespace dispatch::observability

#endif
