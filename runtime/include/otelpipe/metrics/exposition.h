#pragma once

#include <opentelemetry/sdk/metrics/export/metric_producer.h>
#include <opentelemetry/sdk/metrics/instruments.h>
#include <opentelemetry/sdk/metrics/metric_reader.h>

#include <chrono>
#include <string>
#include <string_view>

#include "otelpipe/resource.h"

namespace otelpipe::metrics {

inline constexpr const char* kExpositionContentType = "text/plain; version=0.0.4; charset=utf-8";

// ------------------------------------------------------------
// Prometheus text exposition (format 0.0.4)
// ------------------------------------------------------------
// Renders one cumulative collection:
//
//   target_info{<resource attributes>} 1        always first
//   Counter          -> counter   <name>_total
//   UpDownCounter    -> gauge
//   ObservableGauge  -> gauge
//   Histogram        -> histogram <name>_bucket{le=...}, _sum, _count
//
// Families are sorted by name; instruments with no points are skipped.
// Every sample carries the resource attributes merged with its own
// labels; a point label wins over a resource attribute of the same key.
// On histogram samples a point label named `le` is renamed `exported_le`
// so it cannot clash with the bucket bound.
//
std::string RenderExposition(const opentelemetry::sdk::metrics::ResourceMetrics& data,
                             const Resource& resource);

// ------------------------------------------------------------
// ExpositionReader
// ------------------------------------------------------------
// Pull reader behind the scrape endpoint. Always cumulative; it never
// pushes, so flushing it is a no-op.
//
class ExpositionReader final : public opentelemetry::sdk::metrics::MetricReader {
 public:
  explicit ExpositionReader(Resource resource);

  // Collects and renders. Throws std::runtime_error once the reader is
  // shut down.
  std::string Render();

  opentelemetry::sdk::metrics::AggregationTemporality GetAggregationTemporality(
      opentelemetry::sdk::metrics::InstrumentType) const noexcept override {
    return opentelemetry::sdk::metrics::AggregationTemporality::kCumulative;
  }

 private:
  bool OnForceFlush(std::chrono::microseconds) noexcept override {
    return true;
  }

  bool OnShutDown(std::chrono::microseconds) noexcept override {
    return true;
  }

  void OnInitialized() noexcept override {}

  const Resource resource_;
};

// Metric names keep [a-zA-Z0-9_:]; anything else becomes '_'.
std::string SanitizeMetricName(std::string_view name);

// Label names keep [a-zA-Z0-9_]; anything else becomes '_'.
std::string SanitizeLabelName(std::string_view name);

// Escapes backslash, double quote and newline.
std::string EscapeLabelValue(std::string_view value);

// Shortest round-trip form; NaN, +Inf and -Inf spelled the Prometheus way.
std::string FormatSampleValue(double value);

}  // namespace otelpipe::metrics
