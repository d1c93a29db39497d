#pragma once

#include <initializer_list>
#include <memory>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace dispatch::runtime::config {
class RuntimeConfig;
}

namespace dispatch::observability {

// Installs the OTLP tracer provider when observability.tracing_enabled.
bool InitializeTracing(const dispatch::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  Active span for the current scope.

  Attributes take the same fields as log lines, so a span and the lines
  logged inside it carry the same delivery, rider and exchange keys.
  Without ENABLE_OTEL every member is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name, std::initializer_list<LogField> attributes = {});
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(const LogField& field);

  // Marks the span failed.
  void RecordError(std::string_view what);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const dispatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view, std::initializer_list<LogField>) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(const LogField&) {
}

inline void SpanScope::RecordError(std::string_view) {
}
#endif

} // namespace dispatch::observability
