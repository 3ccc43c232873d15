#include "otelpipe/otel.h"

#include <fmt/format.h>
#include <opentelemetry/sdk/logs/processor.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "otelpipe/exporters/otel_conversion.h"
#include "otelpipe/observability/logging.h"
#include "otelpipe/observability/syslog_writer.h"
#include "otelpipe/pipeline/target_policy.h"
#include "otelpipe/setup_error.h"

namespace otelpipe {

namespace {

constexpr auto kDefaultStdoutInterval = std::chrono::seconds(60);

}  // namespace

Otel::Otel(Config config, std::shared_ptr<exporters::ExporterFactory> exporter_factory)
    : config_(std::move(config)) {
  if (!exporter_factory) {
    throw SetupError("exporter factory must not be null");
  }

  Validate(config_);

  auto filter = std::make_shared<const LevelFilter>(LevelFilter::Parse(config_.level));
  auto regex_filters = observability::CompileRegexFilters(config_.regex_filters);

  resource_ = std::make_shared<const Resource>(Resource::FromConfig(config_));
  registry_ = std::make_shared<metrics::InstrumentRegistry>(*resource_);

  // Readers go in before the application creates any instrument.
  auto exposition = std::make_unique<metrics::ExpositionReader>(*resource_);
  exposition_ = exposition.get();
  registry_->AddReader(std::move(exposition));

  BuildMetricPipelines(*exporter_factory);
  BuildLogPipelines(*exporter_factory, filter);

  if (config_.prometheus_config) {
    metrics::ExpositionReader* reader = exposition_;
    scrape_server_ = std::make_unique<scrape::ScrapeServer>(config_.prometheus_config->port,
                                                            [reader] { return reader->Render(); });
  }

  opentelemetry::nostd::shared_ptr<opentelemetry::logs::Logger> logger;
  if (logger_provider_) {
    logger = logger_provider_->GetLogger(exporters::kScopeName, exporters::kScopeName,
                                         exporters::kScopeVersion);
  }

  bridge_ = std::make_shared<observability::LogBridge>(
      observability::LogBridge::Options{
          .service_name = config_.service_name,
          .host_name = observability::LocalHostName(),
          .emit_to_stderr = config_.emit_logs_to_stderr,
      },
      filter, std::move(regex_filters), std::move(logger));
  observability::GetLogRouter()->Attach(bridge_);

  OP_LOG_INFO_FMT("otel started for service '{}': {} metric targets, {} log targets{}",
                  config_.service_name, metric_pipelines_.size(), log_pipelines_.size(),
                  scrape_server_ ? fmt::format(", scrape port {}", scrape_server_->port()) : "");
}

Otel::~Otel() {
  if (bridge_) {
    observability::GetLogRouter()->Detach(bridge_.get());
  }
  StopPipelines();
}

void Otel::BuildMetricPipelines(exporters::ExporterFactory& factory) {
  std::optional<std::chrono::seconds> shortest;

  for (const auto& target : config_.metrics_export_targets) {
    if (target.timeout > target.interval_secs) {
      OP_LOG_WARN_FMT("metric target {}: timeout {}s exceeds interval {}s, capping at the interval",
                      target.url, target.timeout, target.interval_secs);
    }

    std::unique_ptr<opentelemetry::sdk::metrics::PushMetricExporter> exporter;
    try {
      exporter = factory.CreateMetricExporter(target);
    } catch (const std::exception& e) {
      OP_LOG_ERROR_FMT("unable to create metric exporter for target [{}]: {}", target.url,
                       e.what());
      continue;
    }
    if (!exporter) {
      OP_LOG_ERROR_FMT("no metric exporter for target [{}]", target.url);
      continue;
    }

    const auto interval = std::chrono::seconds(target.interval_secs);
    shortest = shortest ? std::min(*shortest, interval) : interval;

    metric_pipelines_.push_back(std::make_unique<pipeline::MetricPipeline>(
        pipeline::PipelineOptions{
            .name = target.url,
            .interval = interval,
            .timeout = std::chrono::seconds(target.timeout),
        },
        pipeline::TemporalityPolicy::ForTarget(target), std::move(exporter)));
    metric_pipelines_.back()->AttachTo(*registry_);
  }

  if (config_.emit_metrics_to_stdout) {
    const auto interval = shortest.value_or(kDefaultStdoutInterval);
    metric_pipelines_.push_back(std::make_unique<pipeline::MetricPipeline>(
        pipeline::PipelineOptions{.name = "stdout", .interval = interval, .timeout = interval},
        pipeline::TemporalityPolicy(Temporality::Cumulative), factory.CreateStdoutExporter()));
    metric_pipelines_.back()->AttachTo(*registry_);
  }
}

void Otel::BuildLogPipelines(exporters::ExporterFactory& factory,
                             const std::shared_ptr<const LevelFilter>& filter) {
  for (const auto& target : config_.log_export_targets) {
    if (target.timeout > target.interval_secs) {
      OP_LOG_WARN_FMT("log target {}: timeout {}s exceeds interval {}s, capping at the interval",
                      target.url, target.timeout, target.interval_secs);
    }

    std::unique_ptr<opentelemetry::sdk::logs::LogRecordExporter> exporter;
    try {
      exporter = factory.CreateLogExporter(target);
    } catch (const std::exception& e) {
      OP_LOG_ERROR_FMT("unable to create log exporter for target [{}]: {}", target.url, e.what());
      continue;
    }
    if (!exporter) {
      OP_LOG_ERROR_FMT("no log exporter for target [{}]", target.url);
      continue;
    }

    pipeline::LogPipelineOptions options;
    options.base = pipeline::PipelineOptions{
        .name = target.url,
        .interval = std::chrono::seconds(target.interval_secs),
        .timeout = std::chrono::seconds(target.timeout),
    };

    log_pipelines_.push_back(std::make_unique<pipeline::LogPipeline>(
        std::move(options), pipeline::LogFilterPolicy::ForTarget(target, filter),
        std::move(exporter)));
  }

  if (log_pipelines_.empty()) {
    return;
  }

  std::vector<std::unique_ptr<opentelemetry::sdk::logs::LogRecordProcessor>> processors;
  processors.reserve(log_pipelines_.size());
  for (const auto& p : log_pipelines_) {
    processors.push_back(p->ReleaseProcessor());
  }
  logger_provider_ = std::make_shared<opentelemetry::sdk::logs::LoggerProvider>(
      std::move(processors), exporters::ToOtelResource(*resource_));
}

void Otel::Run(const StopToken& stop) {
  if (!stop.stop_possible()) {
    throw std::invalid_argument("Otel::Run needs a token from a StopSource");
  }
  if (ran_.exchange(true)) {
    throw std::logic_error("Otel::Run can only be called once");
  }

  std::thread scrape;
  if (scrape_server_) {
    scrape = std::thread([this, &stop] { scrape_server_->Serve(stop); });
  }

  stop.wait();

  if (scrape.joinable()) {
    scrape.join();
  }
  StopPipelines();
  OP_LOG_DEBUG_FMT("otel tasks stopped");
}

void Otel::Shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  observability::GetLogRouter()->Detach(bridge_.get());
  StopPipelines();
}

void Otel::StopPipelines() {
  std::call_once(stop_once_, [this] {
    // The SDK stops its export threads without a last collection, so
    // push what is pending first.
    for (const auto& p : metric_pipelines_) {
      p->Flush();
    }
    registry_->Shutdown();

    if (logger_provider_) {
      std::chrono::milliseconds timeout{0};
      for (const auto& p : log_pipelines_) {
        timeout = std::max(timeout, p->options().base.timeout);
      }
      logger_provider_->ForceFlush(std::chrono::duration_cast<std::chrono::microseconds>(timeout));
      logger_provider_->Shutdown();
    }
  });
}

std::optional<uint16_t> Otel::scrape_port() const {
  if (!scrape_server_) {
    return std::nullopt;
  }
  return scrape_server_->port();
}

std::string Otel::RenderScrape() {
  return exposition_->Render();
}

std::vector<NamedStats> Otel::metric_pipeline_stats() const {
  std::vector<NamedStats> out;
  out.reserve(metric_pipelines_.size());
  for (const auto& p : metric_pipelines_) {
    out.push_back(NamedStats{p->options().name, p->stats()});
  }
  return out;
}

std::vector<NamedStats> Otel::log_pipeline_stats() const {
  std::vector<NamedStats> out;
  out.reserve(log_pipelines_.size());
  for (const auto& p : log_pipelines_) {
    out.push_back(NamedStats{p->options().base.name, p->stats()});
  }
  return out;
}

}  // namespace otelpipe
