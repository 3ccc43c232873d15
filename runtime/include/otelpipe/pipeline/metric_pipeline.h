#pragma once

#include <opentelemetry/sdk/common/exporter_utils.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_options.h>
#include <opentelemetry/sdk/metrics/instruments.h>
#include <opentelemetry/sdk/metrics/metric_reader.h>
#include <opentelemetry/sdk/metrics/push_metric_exporter.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "otelpipe/metrics/instrument_registry.h"
#include "otelpipe/pipeline/target_policy.h"

namespace otelpipe::pipeline {

struct PipelineOptions {
  std::string name;
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

// Per-pipeline export counters.
struct PipelineStats {
  uint64_t exports = 0;
  uint64_t failed = 0;    // exporter reported failure
  uint64_t overran = 0;   // took longer than `timeout`
  uint64_t filtered = 0;  // log pipelines only: rejected by the target predicate
};

// Written by the exporter wrapper the SDK owns, read by the pipeline.
class ExportCounters {
 public:
  void RecordExport(bool ok, bool overran) noexcept;

  void RecordFiltered() noexcept {
    filtered_.fetch_add(1, std::memory_order_relaxed);
  }

  PipelineStats Snapshot() const noexcept;

 private:
  std::atomic<uint64_t> exports_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> overran_{0};
  std::atomic<uint64_t> filtered_{0};
};

// Reader schedule for one target. The SDK rejects a collect deadline
// that is not below the interval, so the deadline is capped at 90% of it.
opentelemetry::sdk::metrics::PeriodicExportingMetricReaderOptions ReaderOptions(
    const PipelineOptions& options);

// ------------------------------------------------------------
// ReportingMetricExporter
// ------------------------------------------------------------
// Wraps a target's exporter. Answers the target's temporality to the
// reader, times every push, logs failures and counts them.
//
class ReportingMetricExporter final : public opentelemetry::sdk::metrics::PushMetricExporter {
 public:
  ReportingMetricExporter(PipelineOptions options, TemporalityPolicy policy,
                          std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter> exporter,
                          std::shared_ptr<ExportCounters> counters);

  opentelemetry::sdk::common::ExportResult Export(
      const opentelemetry::sdk::metrics::ResourceMetrics& data) noexcept override;

  opentelemetry::sdk::metrics::AggregationTemporality GetAggregationTemporality(
      opentelemetry::sdk::metrics::InstrumentType type) const noexcept override;

  bool ForceFlush(std::chrono::microseconds timeout) noexcept override;

  bool Shutdown(std::chrono::microseconds timeout) noexcept override;

 private:
  const PipelineOptions options_;
  const TemporalityPolicy policy_;
  const std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter> exporter_;
  const std::shared_ptr<ExportCounters> counters_;
};

// ------------------------------------------------------------
// MetricPipeline
// ------------------------------------------------------------
// Periodic push of the registry to one metric target, run by an SDK
// PeriodicExportingMetricReader on its own thread.
//
// - Ticks every `interval`. A push is awaited for at most `timeout`; a
//   push still running past that delays only this target's next tick.
// - Each pipeline's reader keeps its own aggregation state, so a delta
//   target's baseline moves only when that target collects.
// - Failures are logged and counted, never propagated.
//
class MetricPipeline {
 public:
  MetricPipeline(PipelineOptions options, TemporalityPolicy policy,
                 std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter> exporter);

  MetricPipeline(const MetricPipeline&) = delete;
  MetricPipeline& operator=(const MetricPipeline&) = delete;

  // Hands the reader to `registry`, which starts its thread. The first
  // push fires one interval later. Throws std::logic_error when called
  // twice.
  void AttachTo(metrics::InstrumentRegistry& registry);

  // Collects and pushes now, bounded by `timeout`. False before
  // AttachTo or when the push fails.
  bool Flush();

  PipelineStats stats() const noexcept {
    return counters_->Snapshot();
  }

  const PipelineOptions& options() const noexcept {
    return options_;
  }

 private:
  const PipelineOptions options_;
  const std::shared_ptr<ExportCounters> counters_;

  std::unique_ptr<opentelemetry::sdk::metrics::MetricReader> pending_;
  opentelemetry::sdk::metrics::MetricReader* reader_{nullptr};  // owned by the registry
};

}  // namespace otelpipe::pipeline
