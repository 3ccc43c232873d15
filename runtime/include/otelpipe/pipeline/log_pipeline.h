#pragma once

#include <opentelemetry/nostd/span.h>
#include <opentelemetry/sdk/common/exporter_utils.h>
#include <opentelemetry/sdk/logs/exporter.h>
#include <opentelemetry/sdk/logs/processor.h>
#include <opentelemetry/sdk/logs/recordable.h>

#include <chrono>
#include <cstddef>
#include <memory>

#include "otelpipe/pipeline/metric_pipeline.h"
#include "otelpipe/pipeline/target_policy.h"

namespace otelpipe::pipeline {

struct LogPipelineOptions {
  PipelineOptions base{"", std::chrono::seconds(1), std::chrono::seconds(30)};
  std::size_t max_queue_size{2048};
  std::size_t max_export_batch_size{512};
};

// ------------------------------------------------------------
// FilteringLogRecordProcessor
// ------------------------------------------------------------
// Applies one target's (module, severity) predicate in front of another
// processor, a BatchLogRecordProcessor in production. Records it rejects
// never reach the inner processor's buffer. OnEmit runs on the logging
// thread and never logs.
//
class FilteringLogRecordProcessor final : public opentelemetry::sdk::logs::LogRecordProcessor {
 public:
  FilteringLogRecordProcessor(LogFilterPolicy policy,
                              std::unique_ptr<opentelemetry::sdk::logs::LogRecordProcessor> inner,
                              std::shared_ptr<ExportCounters> counters);

  std::unique_ptr<opentelemetry::sdk::logs::Recordable> MakeRecordable() noexcept override;

  void OnEmit(std::unique_ptr<opentelemetry::sdk::logs::Recordable>&& record) noexcept override;

  bool ForceFlush(std::chrono::microseconds timeout) noexcept override;

  bool Shutdown(std::chrono::microseconds timeout) noexcept override;

 private:
  const LogFilterPolicy policy_;
  const std::unique_ptr<opentelemetry::sdk::logs::LogRecordProcessor> inner_;
  const std::shared_ptr<ExportCounters> counters_;
};

// Wraps a target's log exporter; logs failed pushes and counts them.
class ReportingLogExporter final : public opentelemetry::sdk::logs::LogRecordExporter {
 public:
  ReportingLogExporter(PipelineOptions options,
                       std::unique_ptr<opentelemetry::sdk::logs::LogRecordExporter> exporter,
                       std::shared_ptr<ExportCounters> counters);

  std::unique_ptr<opentelemetry::sdk::logs::Recordable> MakeRecordable() noexcept override;

  opentelemetry::sdk::common::ExportResult Export(
      const opentelemetry::nostd::span<std::unique_ptr<opentelemetry::sdk::logs::Recordable>>&
          records) noexcept override;

  bool ForceFlush(std::chrono::microseconds timeout) noexcept override;

  bool Shutdown(std::chrono::microseconds timeout) noexcept override;

 private:
  const PipelineOptions options_;
  const std::unique_ptr<opentelemetry::sdk::logs::LogRecordExporter> exporter_;
  const std::shared_ptr<ExportCounters> counters_;
};

// ------------------------------------------------------------
// LogPipeline
// ------------------------------------------------------------
// Buffered, at-most-once delivery of log records to one target:
// FilteringLogRecordProcessor -> BatchLogRecordProcessor -> exporter.
//
// - Emitting never blocks. A full buffer (max_queue_size) drops the
//   newest record.
// - Every interval the buffer is drained and pushed in batches of at
//   most max_export_batch_size, each bounded by `timeout`.
// - A failed batch is dropped. Nothing is replayed.
//
class LogPipeline {
 public:
  LogPipeline(LogPipelineOptions options, LogFilterPolicy policy,
              std::unique_ptr<opentelemetry::sdk::logs::LogRecordExporter> exporter);

  LogPipeline(const LogPipeline&) = delete;
  LogPipeline& operator=(const LogPipeline&) = delete;

  // The processor chain, for the LoggerProvider that will own it. Throws
  // std::logic_error when called twice.
  std::unique_ptr<opentelemetry::sdk::logs::LogRecordProcessor> ReleaseProcessor();

  PipelineStats stats() const noexcept {
    return counters_->Snapshot();
  }

  const LogPipelineOptions& options() const noexcept {
    return options_;
  }

 private:
  const LogPipelineOptions options_;
  const std::shared_ptr<ExportCounters> counters_;
  std::unique_ptr<opentelemetry::sdk::logs::LogRecordProcessor> processor_;
};

}  // namespace otelpipe::pipeline
