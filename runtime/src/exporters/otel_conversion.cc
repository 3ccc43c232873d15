#include "otelpipe/exporters/otel_conversion.h"

#include <fmt/format.h>
#include <opentelemetry/common/timestamp.h>
#include <opentelemetry/logs/log_record.h>
#include <opentelemetry/nostd/string_view.h>
#include <opentelemetry/nostd/variant.h>

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace otel_common = opentelemetry::common;
namespace otel_metrics = opentelemetry::sdk::metrics;
namespace otel_resource = opentelemetry::sdk::resource;
namespace otel_logs = opentelemetry::logs;
namespace nostd = opentelemetry::nostd;

namespace otelpipe::exporters {

otel_resource::Resource ToOtelResource(const Resource& resource) {
  otel_resource::ResourceAttributes attributes;
  for (const auto& [key, value] : resource.attributes()) {
    attributes.SetAttribute(key, nostd::string_view(value));
  }
  return otel_resource::Resource::Create(attributes);
}

metrics::Labels ToLabels(const otel_metrics::PointAttributes& attributes) {
  metrics::Labels labels;
  for (const auto& [key, value] : attributes) {
    nostd::visit(
        [&labels, &key = key](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::string>) {
            labels.emplace(key, v);
          } else if constexpr (std::is_arithmetic_v<T>) {
            labels.emplace(key, fmt::format("{}", v));
          }
        },
        value);
  }
  return labels;
}

double ToDouble(const otel_metrics::ValueType& value) noexcept {
  if (nostd::holds_alternative<double>(value)) {
    return nostd::get<double>(value);
  }
  return static_cast<double>(nostd::get<int64_t>(value));
}

std::string_view DescribeExportResult(opentelemetry::sdk::common::ExportResult result) noexcept {
  switch (result) {
    case opentelemetry::sdk::common::ExportResult::kSuccess:
      return "success";
    case opentelemetry::sdk::common::ExportResult::kFailure:
      return "failure";
    case opentelemetry::sdk::common::ExportResult::kFailureFull:
      return "exporter queue full";
    case opentelemetry::sdk::common::ExportResult::kFailureInvalidArgument:
      return "invalid argument";
  }
  return "unknown";
}

otel_logs::Severity ToOtelSeverity(Severity severity) noexcept {
  switch (severity) {
    case Severity::Trace:
      return otel_logs::Severity::kTrace;
    case Severity::Debug:
      return otel_logs::Severity::kDebug;
    case Severity::Info:
      return otel_logs::Severity::kInfo;
    case Severity::Warn:
      return otel_logs::Severity::kWarn;
    case Severity::Error:
      return otel_logs::Severity::kError;
  }
  return otel_logs::Severity::kInfo;
}

Severity FromOtelSeverity(otel_logs::Severity severity) noexcept {
  // Each OpenTelemetry level spans four numbers: kTrace..kTrace4 = 1..4,
  // kDebug = 5, kInfo = 9, kWarn = 13, kError = 17, kFatal = 21.
  const auto n = static_cast<int>(severity);
  if (n >= static_cast<int>(otel_logs::Severity::kError)) {
    return Severity::Error;
  }
  if (n >= static_cast<int>(otel_logs::Severity::kWarn)) {
    return Severity::Warn;
  }
  if (n >= static_cast<int>(otel_logs::Severity::kInfo)) {
    return Severity::Info;
  }
  if (n >= static_cast<int>(otel_logs::Severity::kDebug)) {
    return Severity::Debug;
  }
  return Severity::Trace;
}

void EmitLogRecord(otel_logs::Logger& logger, const observability::LogRecord& record) {
  nostd::unique_ptr<otel_logs::LogRecord> out = logger.CreateLogRecord();
  if (!out) {
    return;
  }

  const otel_common::SystemTimestamp timestamp(record.timestamp);
  out->SetTimestamp(timestamp);
  out->SetObservedTimestamp(timestamp);
  out->SetSeverity(ToOtelSeverity(record.severity));
  out->SetBody(nostd::string_view(record.body));
  out->SetAttribute(kModuleAttribute, nostd::string_view(record.module));
  out->SetAttribute(kThreadIdAttribute, static_cast<int64_t>(record.thread_id));
  logger.EmitLogRecord(std::move(out));
}

}  // namespace otelpipe::exporters
