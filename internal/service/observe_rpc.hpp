#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace dispatch::service {

/*
  Runs fn inside a span, records request count and latency for route and
  logs failures before rethrowing them.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  dispatch::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(dispatch::observability::StringField("subject", subject));
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    dispatch::observability::Metrics::Instance().RecordRequest(route, success);
    dispatch::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      finish(true);
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordError(ex.what());
    DISPATCH_LOG_ERROR("RPC failed", {dispatch::observability::StringField("route", route), dispatch::observability::ErrorField(ex.what()),
                                      dispatch::observability::StringField("subject", subject)});
    finish(false);
    throw;
  }
}

} // namespace dispatch::service
