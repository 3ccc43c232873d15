#pragma once

#include <opentelemetry/logs/logger.h>
#include <opentelemetry/logs/severity.h>
#include <opentelemetry/sdk/common/exporter_utils.h>
#include <opentelemetry/sdk/metrics/data/metric_data.h>
#include <opentelemetry/sdk/metrics/data/point_data.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <string_view>

#include "otelpipe/metrics/instruments.h"
#include "otelpipe/observability/log_record.h"
#include "otelpipe/resource.h"
#include "otelpipe/severity.h"

// ============================================================
// Conversion between the otelpipe data model and the OpenTelemetry
// API/SDK data model.
// ============================================================

namespace otelpipe::exporters {

// Meter and logger scope reported with every batch.
inline constexpr const char* kScopeName = "otelpipe";
inline constexpr const char* kScopeVersion = "1.0.0";

// Log attributes carrying the spdlog logger name and thread id.
inline constexpr const char* kModuleAttribute = "module";
inline constexpr const char* kThreadIdAttribute = "thread.id";

opentelemetry::sdk::resource::Resource ToOtelResource(const Resource& resource);

// Labels of one exported point. Non-string scalar values are rendered as
// text; array values are skipped.
metrics::Labels ToLabels(const opentelemetry::sdk::metrics::PointAttributes& attributes);

double ToDouble(const opentelemetry::sdk::metrics::ValueType& value) noexcept;

std::string_view DescribeExportResult(opentelemetry::sdk::common::ExportResult result) noexcept;

opentelemetry::logs::Severity ToOtelSeverity(Severity severity) noexcept;

// Fatal folds into Error; an unset severity reads as Trace.
Severity FromOtelSeverity(opentelemetry::logs::Severity severity) noexcept;

// Emits `record` through `logger` with its module and thread id as
// attributes.
void EmitLogRecord(opentelemetry::logs::Logger& logger, const observability::LogRecord& record);

}  // namespace otelpipe::exporters
