#include "otelpipe/pipeline/metric_pipeline.h"

#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "otelpipe/exporters/otel_conversion.h"
#include "otelpipe/observability/logging.h"

namespace otel_metrics = opentelemetry::sdk::metrics;
namespace otel_common = opentelemetry::sdk::common;

namespace otelpipe::pipeline {

void ExportCounters::RecordExport(bool ok, bool overran) noexcept {
  exports_.fetch_add(1, std::memory_order_relaxed);
  if (!ok) {
    failed_.fetch_add(1, std::memory_order_relaxed);
  }
  if (overran) {
    overran_.fetch_add(1, std::memory_order_relaxed);
  }
}

PipelineStats ExportCounters::Snapshot() const noexcept {
  return PipelineStats{
      .exports = exports_.load(std::memory_order_relaxed),
      .failed = failed_.load(std::memory_order_relaxed),
      .overran = overran_.load(std::memory_order_relaxed),
      .filtered = filtered_.load(std::memory_order_relaxed),
  };
}

otel_metrics::PeriodicExportingMetricReaderOptions ReaderOptions(const PipelineOptions& options) {
  otel_metrics::PeriodicExportingMetricReaderOptions reader;
  reader.export_interval_millis = options.interval;
  reader.export_timeout_millis = std::min(options.timeout, options.interval * 9 / 10);
  return reader;
}

// ------------------------------------------------------------
// ReportingMetricExporter
// ------------------------------------------------------------

ReportingMetricExporter::ReportingMetricExporter(
    PipelineOptions options, TemporalityPolicy policy,
    std::unique_ptr<otel_metrics::PushMetricExporter> exporter,
    std::shared_ptr<ExportCounters> counters)
    : options_(std::move(options)),
      policy_(policy),
      exporter_(std::move(exporter)),
      counters_(std::move(counters)) {}

otel_common::ExportResult ReportingMetricExporter::Export(
    const otel_metrics::ResourceMetrics& data) noexcept {
  const auto start = std::chrono::steady_clock::now();
  const auto result = exporter_->Export(data);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  const bool ok = result == otel_common::ExportResult::kSuccess;
  const bool overran = elapsed > options_.timeout;
  counters_->RecordExport(ok, overran);

  if (!ok) {
    OP_LOG_WARN_FMT("metric pipeline '{}': export failed: {}", options_.name,
                    exporters::DescribeExportResult(result));
  } else if (overran) {
    OP_LOG_WARN_FMT("metric pipeline '{}': export took {}ms, over its {}ms timeout",
                    options_.name, elapsed.count(), options_.timeout.count());
  }
  return result;
}

otel_metrics::AggregationTemporality ReportingMetricExporter::GetAggregationTemporality(
    otel_metrics::InstrumentType type) const noexcept {
  return policy_.For(type);
}

bool ReportingMetricExporter::ForceFlush(std::chrono::microseconds timeout) noexcept {
  return exporter_->ForceFlush(timeout);
}

bool ReportingMetricExporter::Shutdown(std::chrono::microseconds timeout) noexcept {
  return exporter_->Shutdown(timeout);
}

// ------------------------------------------------------------
// MetricPipeline
// ------------------------------------------------------------

MetricPipeline::MetricPipeline(PipelineOptions options, TemporalityPolicy policy,
                               std::unique_ptr<otel_metrics::PushMetricExporter> exporter)
    : options_(std::move(options)), counters_(std::make_shared<ExportCounters>()) {
  if (!exporter) {
    throw std::invalid_argument("metric pipeline needs an exporter");
  }

  auto reporting =
      std::make_unique<ReportingMetricExporter>(options_, policy, std::move(exporter), counters_);
  pending_ = otel_metrics::PeriodicExportingMetricReaderFactory::Create(std::move(reporting),
                                                                       ReaderOptions(options_));
}

void MetricPipeline::AttachTo(metrics::InstrumentRegistry& registry) {
  if (!pending_) {
    throw std::logic_error("metric pipeline '" + options_.name + "' is already attached");
  }

  reader_ = pending_.get();
  registry.AddReader(std::move(pending_));

  OP_LOG_DEBUG_FMT("metric pipeline '{}' started (interval={}ms timeout={}ms)", options_.name,
                   options_.interval.count(), options_.timeout.count());
}

bool MetricPipeline::Flush() {
  if (!reader_) {
    return false;
  }
  return reader_->ForceFlush(
      std::chrono::duration_cast<std::chrono::microseconds>(options_.timeout));
}

}  // namespace otelpipe::pipeline
