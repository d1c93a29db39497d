#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace dispatch::runtime::config {
class RuntimeConfig;
}

namespace dispatch::observability {

// Installs the OTLP meter provider when observability.metrics_enabled.
bool InitializeMetrics(const dispatch::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Dispatch instruments:

    dispatch.request.count / dispatch.request.latency_ms   per RPC route
    dispatch.bus.messages                                   per exchange and outcome
    dispatch.settlement.amount                              rider and admin shares
    dispatch.connections.live                               registry size
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordBusMessage(std::string_view exchange, bool success);

  // kind is "rider" or "admin"
  void ObserveSettlementAmount(std::string_view kind, double amount);

  void SetLiveConnections(std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const dispatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
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

inline void Metrics::RecordBusMessage(std::string_view, bool) {
}

inline void Metrics::ObserveSettlementAmount(std::string_view, double) {
}

inline void Metrics::SetLiveConnections(std::int64_t) {
}
#endif

} // namespace dispatch::observability
