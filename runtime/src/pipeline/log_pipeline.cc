#include "otelpipe/pipeline/log_pipeline.h"

#include <opentelemetry/nostd/variant.h>
#include <opentelemetry/sdk/logs/batch_log_record_processor_factory.h>
#include <opentelemetry/sdk/logs/batch_log_record_processor_options.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "otelpipe/exporters/otel_conversion.h"
#include "otelpipe/observability/logging.h"

namespace otel_logs = opentelemetry::sdk::logs;
namespace otel_common = opentelemetry::common;
namespace nostd = opentelemetry::nostd;

namespace otelpipe::pipeline {

namespace {

// Forwards every field to the inner processor's recordable and keeps the
// two the target predicate needs.
class FilteredRecordable final : public otel_logs::Recordable {
 public:
  explicit FilteredRecordable(std::unique_ptr<otel_logs::Recordable> inner)
      : inner_(std::move(inner)) {}

  void SetTimestamp(otel_common::SystemTimestamp timestamp) noexcept override {
    inner_->SetTimestamp(timestamp);
  }

  void SetObservedTimestamp(otel_common::SystemTimestamp timestamp) noexcept override {
    inner_->SetObservedTimestamp(timestamp);
  }

  void SetSeverity(opentelemetry::logs::Severity severity) noexcept override {
    severity_ = exporters::FromOtelSeverity(severity);
    inner_->SetSeverity(severity);
  }

  void SetBody(const otel_common::AttributeValue& message) noexcept override {
    inner_->SetBody(message);
  }

  void SetAttribute(nostd::string_view key,
                    const otel_common::AttributeValue& value) noexcept override {
    if (key == exporters::kModuleAttribute &&
        nostd::holds_alternative<nostd::string_view>(value)) {
      const auto module = nostd::get<nostd::string_view>(value);
      module_.assign(module.data(), module.size());
    }
    inner_->SetAttribute(key, value);
  }

  void SetEventId(int64_t id, nostd::string_view name) noexcept override {
    inner_->SetEventId(id, name);
  }

  void SetTraceId(const opentelemetry::trace::TraceId& trace_id) noexcept override {
    inner_->SetTraceId(trace_id);
  }

  void SetSpanId(const opentelemetry::trace::SpanId& span_id) noexcept override {
    inner_->SetSpanId(span_id);
  }

  void SetTraceFlags(const opentelemetry::trace::TraceFlags& trace_flags) noexcept override {
    inner_->SetTraceFlags(trace_flags);
  }

  void SetResource(const opentelemetry::sdk::resource::Resource& resource) noexcept override {
    inner_->SetResource(resource);
  }

  void SetInstrumentationScope(
      const opentelemetry::sdk::instrumentationscope::InstrumentationScope& scope) noexcept
      override {
    inner_->SetInstrumentationScope(scope);
  }

  const std::string& module() const noexcept {
    return module_;
  }

  Severity severity() const noexcept {
    return severity_;
  }

  std::unique_ptr<otel_logs::Recordable> Release() noexcept {
    return std::move(inner_);
  }

 private:
  std::unique_ptr<otel_logs::Recordable> inner_;
  std::string module_;
  Severity severity_{Severity::Trace};
};

}  // namespace

// ------------------------------------------------------------
// FilteringLogRecordProcessor
// ------------------------------------------------------------

FilteringLogRecordProcessor::FilteringLogRecordProcessor(
    LogFilterPolicy policy, std::unique_ptr<otel_logs::LogRecordProcessor> inner,
    std::shared_ptr<ExportCounters> counters)
    : policy_(std::move(policy)), inner_(std::move(inner)), counters_(std::move(counters)) {
  if (!inner_) {
    throw std::invalid_argument("filtering processor needs an inner processor");
  }
}

std::unique_ptr<otel_logs::Recordable> FilteringLogRecordProcessor::MakeRecordable() noexcept {
  auto inner = inner_->MakeRecordable();
  if (!inner) {
    return nullptr;
  }
  return std::make_unique<FilteredRecordable>(std::move(inner));
}

void FilteringLogRecordProcessor::OnEmit(std::unique_ptr<otel_logs::Recordable>&& record) noexcept {
  auto* filtered = dynamic_cast<FilteredRecordable*>(record.get());
  if (!filtered) {
    return;
  }

  if (!policy_.Accepts(filtered->module(), filtered->severity())) {
    if (counters_) {
      counters_->RecordFiltered();
    }
    return;
  }
  inner_->OnEmit(filtered->Release());
}

bool FilteringLogRecordProcessor::ForceFlush(std::chrono::microseconds timeout) noexcept {
  return inner_->ForceFlush(timeout);
}

bool FilteringLogRecordProcessor::Shutdown(std::chrono::microseconds timeout) noexcept {
  return inner_->Shutdown(timeout);
}

// ------------------------------------------------------------
// ReportingLogExporter
// ------------------------------------------------------------

ReportingLogExporter::ReportingLogExporter(PipelineOptions options,
                                           std::unique_ptr<otel_logs::LogRecordExporter> exporter,
                                           std::shared_ptr<ExportCounters> counters)
    : options_(std::move(options)),
      exporter_(std::move(exporter)),
      counters_(std::move(counters)) {}

std::unique_ptr<otel_logs::Recordable> ReportingLogExporter::MakeRecordable() noexcept {
  return exporter_->MakeRecordable();
}

opentelemetry::sdk::common::ExportResult ReportingLogExporter::Export(
    const nostd::span<std::unique_ptr<otel_logs::Recordable>>& records) noexcept {
  const auto start = std::chrono::steady_clock::now();
  const auto result = exporter_->Export(records);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  const bool ok = result == opentelemetry::sdk::common::ExportResult::kSuccess;
  const bool overran = elapsed > options_.timeout;
  counters_->RecordExport(ok, overran);

  // Runs on the batch processor's thread, never on a logging thread.
  if (!ok) {
    OP_LOG_WARN_FMT("log pipeline '{}': export of {} records failed: {}", options_.name,
                    records.size(), exporters::DescribeExportResult(result));
  } else if (overran) {
    OP_LOG_WARN_FMT("log pipeline '{}': export took {}ms, over its {}ms timeout", options_.name,
                    elapsed.count(), options_.timeout.count());
  }
  return result;
}

bool ReportingLogExporter::ForceFlush(std::chrono::microseconds timeout) noexcept {
  return exporter_->ForceFlush(timeout);
}

bool ReportingLogExporter::Shutdown(std::chrono::microseconds timeout) noexcept {
  return exporter_->Shutdown(timeout);
}

// ------------------------------------------------------------
// LogPipeline
// ------------------------------------------------------------

LogPipeline::LogPipeline(LogPipelineOptions options, LogFilterPolicy policy,
                         std::unique_ptr<otel_logs::LogRecordExporter> exporter)
    : options_(std::move(options)), counters_(std::make_shared<ExportCounters>()) {
  if (!exporter) {
    throw std::invalid_argument("log pipeline needs an exporter");
  }

  otel_logs::BatchLogRecordProcessorOptions batch;
  batch.max_queue_size = options_.max_queue_size;
  batch.schedule_delay_millis = options_.base.interval;
  batch.max_export_batch_size = options_.max_export_batch_size;

  auto reporting =
      std::make_unique<ReportingLogExporter>(options_.base, std::move(exporter), counters_);
  processor_ = std::make_unique<FilteringLogRecordProcessor>(
      std::move(policy),
      otel_logs::BatchLogRecordProcessorFactory::Create(std::move(reporting), batch), counters_);
}

std::unique_ptr<otel_logs::LogRecordProcessor> LogPipeline::ReleaseProcessor() {
  if (!processor_) {
    throw std::logic_error("log pipeline '" + options_.base.name + "' is already attached");
  }
  OP_LOG_DEBUG_FMT("log pipeline '{}' started (interval={}ms timeout={}ms)", options_.base.name,
                   options_.base.interval.count(), options_.base.timeout.count());
  return std::move(processor_);
}

}  // namespace otelpipe::pipeline
