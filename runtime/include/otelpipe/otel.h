#pragma once

#include <opentelemetry/sdk/logs/logger_provider.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "otelpipe/config.h"
#include "otelpipe/exporters/exporter_factory.h"
#include "otelpipe/level_filter.h"
#include "otelpipe/metrics/exposition.h"
#include "otelpipe/metrics/instrument_registry.h"
#include "otelpipe/observability/log_bridge.h"
#include "otelpipe/pipeline/log_pipeline.h"
#include "otelpipe/pipeline/metric_pipeline.h"
#include "otelpipe/resource.h"
#include "otelpipe/scrape/scrape_server.h"
#include "otelpipe/stop_token.h"

namespace otelpipe {

struct NamedStats {
  std::string name;
  pipeline::PipelineStats stats;
};

// ------------------------------------------------------------
// Otel
// ------------------------------------------------------------
// Process-wide telemetry orchestrator.
//
// Construction performs all setup: it validates the configuration,
// builds the resource, the instrument registry with one periodic reader
// per metric target (plus the stdout mirror and the scrape reader), a
// logger provider with one processor chain per log target, binds the
// scrape port and attaches the log bridge to spdlog. The SDK starts the
// push threads as readers and processors are attached, so pipelines run
// from construction on. Any failure throws SetupError and leaves nothing
// running.
//
// Run() serves the scrape endpoint and blocks until `stop` is requested,
// then stops every pipeline; each pushes a last time, bounded by its
// timeout. Run can be called once.
//
// Destroying an Otel stops the pipelines and detaches its log bridge.
//
class Otel {
 public:
  explicit Otel(Config config, std::shared_ptr<exporters::ExporterFactory> exporter_factory =
                                   std::make_shared<exporters::OtlpExporterFactory>());
  ~Otel();

  Otel(const Otel&) = delete;
  Otel& operator=(const Otel&) = delete;

  void Run(const StopToken& stop);

  // Pushes whatever is pending once more, bounded by each target's
  // timeout, stops the pipelines and detaches the log bridge. Idempotent.
  void Shutdown();

  const std::shared_ptr<metrics::InstrumentRegistry>& registry() const noexcept {
    return registry_;
  }

  const Resource& resource() const noexcept {
    return *resource_;
  }

  const Config& config() const noexcept {
    return config_;
  }

  // Bound scrape port, when the scrape endpoint is configured.
  std::optional<uint16_t> scrape_port() const;

  // Prometheus text for the current registry state.
  std::string RenderScrape();

  std::vector<NamedStats> metric_pipeline_stats() const;
  std::vector<NamedStats> log_pipeline_stats() const;

  std::size_t metric_pipeline_count() const noexcept {
    return metric_pipelines_.size();
  }

  std::size_t log_pipeline_count() const noexcept {
    return log_pipelines_.size();
  }

 private:
  void BuildMetricPipelines(exporters::ExporterFactory& factory);
  void BuildLogPipelines(exporters::ExporterFactory& factory,
                         const std::shared_ptr<const LevelFilter>& filter);
  void StopPipelines();

  const Config config_;
  std::shared_ptr<const Resource> resource_;
  std::shared_ptr<metrics::InstrumentRegistry> registry_;
  metrics::ExpositionReader* exposition_{nullptr};  // owned by registry_
  std::shared_ptr<opentelemetry::sdk::logs::LoggerProvider> logger_provider_;

  std::vector<std::unique_ptr<pipeline::MetricPipeline>> metric_pipelines_;
  std::vector<std::unique_ptr<pipeline::LogPipeline>> log_pipelines_;
  std::unique_ptr<scrape::ScrapeServer> scrape_server_;
  std::shared_ptr<observability::LogBridge> bridge_;

  std::atomic<bool> ran_{false};
  std::atomic<bool> shut_down_{false};
  std::once_flag stop_once_;
};

}  // namespace otelpipe
