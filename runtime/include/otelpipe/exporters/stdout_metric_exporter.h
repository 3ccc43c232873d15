#pragma once

#include <opentelemetry/sdk/common/exporter_utils.h>
#include <opentelemetry/sdk/metrics/instruments.h>
#include <opentelemetry/sdk/metrics/push_metric_exporter.h>

#include <atomic>
#include <chrono>
#include <iosfwd>
#include <mutex>

namespace otelpipe::exporters {

// Local debugging mirror: prints every metric of a batch as one
// pretty-printed OTLP JSON object. Always cumulative.
class StdoutMetricExporter final : public opentelemetry::sdk::metrics::PushMetricExporter {
 public:
  // `out` defaults to std::cout and must outlive the exporter.
  explicit StdoutMetricExporter(std::ostream* out = nullptr);

  opentelemetry::sdk::common::ExportResult Export(
      const opentelemetry::sdk::metrics::ResourceMetrics& data) noexcept override;

  opentelemetry::sdk::metrics::AggregationTemporality GetAggregationTemporality(
      opentelemetry::sdk::metrics::InstrumentType) const noexcept override {
    return opentelemetry::sdk::metrics::AggregationTemporality::kCumulative;
  }

  bool ForceFlush(std::chrono::microseconds timeout) noexcept override;

  bool Shutdown(std::chrono::microseconds timeout) noexcept override;

 private:
  std::mutex out_mu_;
  std::ostream* out_;
  std::atomic<bool> shut_down_{false};
};

}  // namespace otelpipe::exporters
