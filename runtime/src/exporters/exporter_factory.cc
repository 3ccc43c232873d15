#include "otelpipe/exporters/exporter_factory.h"

#include <fmt/format.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_log_record_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_log_record_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>

#include "otelpipe/exporters/endpoint.h"
#include "otelpipe/exporters/stdout_metric_exporter.h"

namespace otel_otlp = opentelemetry::exporter::otlp;

namespace otelpipe::exporters {

namespace {

// ------------------------------------------------------------
// Shared OTLP client settings
// ------------------------------------------------------------
template <typename Options, typename Target>
void ApplyClientOptions(const Target& target, Options& options) {
  const Endpoint endpoint = ParseEndpoint(target.url);

  options.endpoint = endpoint.ToGrpcEndpoint();
  // A push must never outlive the tick that started it.
  options.timeout = std::chrono::seconds(std::min(target.timeout, target.interval_secs));
  options.use_ssl_credentials = endpoint.tls;
  if (endpoint.tls && target.ca_cert_path) {
    CheckReadable(*target.ca_cert_path);
    options.ssl_credentials_cacert_path = *target.ca_cert_path;
  }
}

}  // namespace

void CheckReadable(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::invalid_argument(fmt::format("cannot read CA file '{}'", path));
  }
}

std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter>
OtlpExporterFactory::CreateMetricExporter(const MetricTarget& target) {
  otel_otlp::OtlpGrpcMetricExporterOptions options;
  ApplyClientOptions(target, options);
  options.aggregation_temporality =
      target.temporality.value_or(Temporality::Cumulative) == Temporality::Delta
          ? otel_otlp::PreferredAggregationTemporality::kDelta
          : otel_otlp::PreferredAggregationTemporality::kCumulative;

  return otel_otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<opentelemetry::sdk::logs::LogRecordExporter>
OtlpExporterFactory::CreateLogExporter(const LogTarget& target) {
  otel_otlp::OtlpGrpcLogRecordExporterOptions options;
  ApplyClientOptions(target, options);

  return otel_otlp::OtlpGrpcLogRecordExporterFactory::Create(options);
}

std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter>
OtlpExporterFactory::CreateStdoutExporter() {
  return std::make_unique<StdoutMetricExporter>();
}

}  // namespace otelpipe::exporters
