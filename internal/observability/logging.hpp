#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace dispatch::runtime::config {
class RuntimeConfig;
}

namespace dispatch::observability {

/*
  Structured log lines.

  A line is the message followed by key=value fields. Every line written
  after InitializeLogging() also carries node=<node_id>, so lines from the
  processes sharing one bus can be told apart, and trace_id/span_id when
  trace context logging is on and a span is active.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Identifiers shared by the dispatch flow, spelled the same everywhere.
LogField DeliveryField(std::string_view delivery_id);
LogField RiderField(std::string_view rider_id);
LogField CustomerField(std::string_view customer_id);
LogField ExchangeField(std::string_view exchange);
LogField ErrorField(std::string_view what);

// Values that are empty or hold spaces, quotes or '=' are quoted, with
// quotes and backslashes escaped.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const dispatch::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace dispatch::observability

#define DISPATCH_LOG_DEBUG(message, ...) ::dispatch::observability::LogDebug((message), ##__VA_ARGS__)
#define DISPATCH_LOG_INFO(message, ...) ::dispatch::observability::LogInfo((message), ##__VA_ARGS__)
#define DISPATCH_LOG_WARN(message, ...) ::dispatch::observability::LogWarn((message), ##__VA_ARGS__)
#define DISPATCH_LOG_ERROR(message, ...) ::dispatch::observability::LogError((message), ##__VA_ARGS__)
