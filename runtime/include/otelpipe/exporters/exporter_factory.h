#pragma once

#include <opentelemetry/sdk/logs/exporter.h>
#include <opentelemetry/sdk/metrics/push_metric_exporter.h>

#include <memory>
#include <string>

#include "otelpipe/config.h"

namespace otelpipe::exporters {

// Builds the exporter behind each pipeline. Otel uses the OTLP factory;
// tests inject their own.
class ExporterFactory {
 public:
  virtual ~ExporterFactory() = default;

  // May throw std::exception; the target is then skipped.
  virtual std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter> CreateMetricExporter(
      const MetricTarget& target) = 0;

  virtual std::unique_ptr<opentelemetry::sdk::logs::LogRecordExporter> CreateLogExporter(
      const LogTarget& target) = 0;

  virtual std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter>
  CreateStdoutExporter() = 0;
};

// OTLP/gRPC exporters. Each push is bounded by the target's timeout,
// capped at its interval. An https/grpcs target uses TLS, with the
// target's CA file when one is given.
class OtlpExporterFactory final : public ExporterFactory {
 public:
  std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter> CreateMetricExporter(
      const MetricTarget& target) override;

  std::unique_ptr<opentelemetry::sdk::logs::LogRecordExporter> CreateLogExporter(
      const LogTarget& target) override;

  std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter> CreateStdoutExporter() override;
};

// Throws std::invalid_argument if `path` cannot be opened for reading.
void CheckReadable(const std::string& path);

}  // namespace otelpipe::exporters
