#include "otelpipe/exporters/stdout_metric_exporter.h"

#include <google/protobuf/util/json_util.h>
#include <opentelemetry/exporters/otlp/otlp_metric_utils.h>
#include <opentelemetry/proto/metrics/v1/metrics.pb.h>
#include <opentelemetry/sdk/metrics/export/metric_producer.h>

#include <exception>
#include <iostream>
#include <string>

#include "otelpipe/observability/logging.h"

namespace otel_metrics = opentelemetry::sdk::metrics;
namespace otel_otlp = opentelemetry::exporter::otlp;
using opentelemetry::sdk::common::ExportResult;

namespace otelpipe::exporters {

StdoutMetricExporter::StdoutMetricExporter(std::ostream* out) : out_(out ? out : &std::cout) {}

ExportResult StdoutMetricExporter::Export(const otel_metrics::ResourceMetrics& data) noexcept {
  if (shut_down_.load()) {
    return ExportResult::kFailure;
  }
  if (data.scope_metric_data_.empty()) {
    return ExportResult::kSuccess;
  }

  try {
    opentelemetry::proto::metrics::v1::ResourceMetrics proto;
    otel_otlp::OtlpMetricUtils::PopulateResourceMetrics(data, &proto);

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;

    std::string rendered;
    for (const auto& scope : proto.scope_metrics()) {
      for (const auto& metric : scope.metrics()) {
        std::string json;
        const auto status = google::protobuf::util::MessageToJsonString(metric, &json, options);
        if (!status.ok()) {
          OP_LOG_WARN_FMT("cannot render metric '{}' as JSON: {}", metric.name(),
                          status.ToString());
          return ExportResult::kFailure;
        }
        rendered += json;
      }
    }

    std::lock_guard lock(out_mu_);
    *out_ << rendered << std::flush;
    return *out_ ? ExportResult::kSuccess : ExportResult::kFailure;
  } catch (const std::exception& e) {
    OP_LOG_WARN_FMT("stdout metric export failed: {}", e.what());
    return ExportResult::kFailure;
  }
}

bool StdoutMetricExporter::ForceFlush(std::chrono::microseconds) noexcept {
  std::lock_guard lock(out_mu_);
  out_->flush();
  return true;
}

bool StdoutMetricExporter::Shutdown(std::chrono::microseconds) noexcept {
  shut_down_ = true;
  return true;
}

}  // namespace otelpipe::exporters
