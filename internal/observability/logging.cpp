#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <shared_mutex>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace dispatch::observability {
namespace {

constexpr const char* kLoggerName     = "rider-dispatch";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Fields appended to every line.
struct LineContext {
  std::string node_id;
  bool        trace_context = false;
};

std::shared_mutex g_context_mutex;
LineContext       g_context;

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value && *value ? std::string(value) : fallback;
}

bool NeedsQuoting(std::string_view value) {
  return value.empty() || value.find_first_of(" \"=\\\t\n") != std::string_view::npos;
}

void AppendField(std::string& out, std::string_view key, std::string_view value) {
  if (!out.empty()) out.push_back(' ');
  out.append(key);
  out.push_back('=');

  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }

  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
      case '\\':
        out.push_back('\\');
        out.push_back(c);
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

void AppendTraceContext(std::string& out) {
#ifdef ENABLE_OTEL
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  AppendField(out, "trace_id", std::string_view(trace_id, sizeof(trace_id)));
  AppendField(out, "span_id", std::string_view(span_id, sizeof(span_id)));
#else
  (void)out;
#endif
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to off
  if (level == spdlog::level::off && name != "off") return spdlog::level::info;
  return level;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.2f}", value)};
}

LogField DeliveryField(std::string_view delivery_id) {
  return StringField("delivery_id", delivery_id);
}

LogField RiderField(std::string_view rider_id) {
  return StringField("rider_id", rider_id);
}

LogField CustomerField(std::string_view customer_id) {
  return StringField("customer_id", customer_id);
}

LogField ExchangeField(std::string_view exchange) {
  return StringField("exchange", exchange);
}

LogField ErrorField(std::string_view what) {
  return StringField("error", what);
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) AppendField(out, field.key, field.value);
  return out;
}

void InitializeLogging(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  const auto level   = EnvOr("DISPATCH_LOG_LEVEL", logging.level().empty() ? "info" : logging.level());
  const auto pattern = EnvOr("DISPATCH_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern());
  const auto trace   = EnvOr("DISPATCH_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "false");

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(ParseLevel(level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  std::unique_lock lock(g_context_mutex);
  g_context.node_id       = config.server().node_id();
  g_context.trace_context = trace == "1" || trace == "true";
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line = FormatFields(fields);
  {
    std::shared_lock lock(g_context_mutex);
    if (g_context.trace_context) AppendTraceContext(line);
    if (!g_context.node_id.empty()) AppendField(line, "node", g_context.node_id);
  }

  if (line.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, line);
}

} // namespace dispatch::observability
