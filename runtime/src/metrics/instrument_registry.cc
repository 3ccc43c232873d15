#include "otelpipe/metrics/instrument_registry.h"

#include <fmt/format.h>
#include <opentelemetry/sdk/metrics/aggregation/aggregation_config.h>
#include <opentelemetry/sdk/metrics/instruments.h>
#include <opentelemetry/sdk/metrics/view/instrument_selector_factory.h>
#include <opentelemetry/sdk/metrics/view/meter_selector_factory.h>
#include <opentelemetry/sdk/metrics/view/view_factory.h>
#include <opentelemetry/sdk/metrics/view/view_registry_factory.h>

#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "otelpipe/exporters/otel_conversion.h"
#include "otelpipe/observability/logging.h"

namespace otel_metrics = opentelemetry::sdk::metrics;

namespace otelpipe::metrics {

InstrumentRegistry::InstrumentRegistry()
    : InstrumentRegistry(Resource(exporters::kScopeName, std::nullopt, {})) {}

InstrumentRegistry::InstrumentRegistry(const Resource& resource)
    : provider_(std::make_shared<otel_metrics::MeterProvider>(
          otel_metrics::ViewRegistryFactory::Create(), exporters::ToOtelResource(resource))),
      meter_(provider_->GetMeter(exporters::kScopeName, exporters::kScopeVersion)) {}

InstrumentRegistry::~InstrumentRegistry() {
  Shutdown();
}

template <typename T, typename Factory>
std::shared_ptr<T> InstrumentRegistry::GetOrCreate(const std::string& name, InstrumentKind kind,
                                                   Factory&& factory) {
  if (name.empty()) {
    throw std::invalid_argument("instrument name must not be empty");
  }

  std::unique_lock lock(mu_);
  for (const auto& instrument : instruments_) {
    if (instrument->descriptor().name != name) {
      continue;
    }
    if (instrument->descriptor().kind != kind) {
      throw std::invalid_argument(
          fmt::format("instrument '{}' is already registered with a different kind", name));
    }
    return std::static_pointer_cast<T>(instrument);
  }

  std::shared_ptr<T> created = factory();
  instruments_.push_back(created);
  return created;
}

std::shared_ptr<Counter> InstrumentRegistry::CreateCounter(const std::string& name,
                                                           const std::string& description,
                                                           const std::string& unit) {
  return GetOrCreate<Counter>(name, InstrumentKind::Counter, [&] {
    return std::make_shared<Counter>(
        InstrumentDescriptor{name, description, unit, InstrumentKind::Counter},
        meter_->CreateDoubleCounter(name, description, unit));
  });
}

std::shared_ptr<UpDownCounter> InstrumentRegistry::CreateUpDownCounter(
    const std::string& name, const std::string& description, const std::string& unit) {
  return GetOrCreate<UpDownCounter>(name, InstrumentKind::UpDownCounter, [&] {
    return std::make_shared<UpDownCounter>(
        InstrumentDescriptor{name, description, unit, InstrumentKind::UpDownCounter},
        meter_->CreateDoubleUpDownCounter(name, description, unit));
  });
}

std::shared_ptr<Histogram> InstrumentRegistry::CreateHistogram(const std::string& name,
                                                               const std::string& description,
                                                               const std::string& unit,
                                                               std::vector<double> boundaries) {
  return GetOrCreate<Histogram>(name, InstrumentKind::Histogram, [&] {
    boundaries = NormalizeBoundaries(std::move(boundaries));

    // Bucket boundaries are a view: it must exist before the instrument.
    auto config = std::make_shared<otel_metrics::HistogramAggregationConfig>();
    config->boundaries_ = boundaries;
    provider_->AddView(
        otel_metrics::InstrumentSelectorFactory::Create(otel_metrics::InstrumentType::kHistogram,
                                                        name, unit),
        otel_metrics::MeterSelectorFactory::Create(exporters::kScopeName,
                                                   exporters::kScopeVersion, ""),
        otel_metrics::ViewFactory::Create(name, description, unit,
                                          otel_metrics::AggregationType::kHistogram,
                                          std::move(config)));

    return std::make_shared<Histogram>(
        InstrumentDescriptor{name, description, unit, InstrumentKind::Histogram},
        std::move(boundaries), meter_->CreateDoubleHistogram(name, description, unit));
  });
}

std::shared_ptr<ObservableGauge> InstrumentRegistry::CreateObservableGauge(
    const std::string& name, ObservableGauge::Callback callback, const std::string& description,
    const std::string& unit) {
  return GetOrCreate<ObservableGauge>(name, InstrumentKind::ObservableGauge, [&] {
    return std::make_shared<ObservableGauge>(
        InstrumentDescriptor{name, description, unit, InstrumentKind::ObservableGauge},
        std::move(callback), meter_->CreateDoubleObservableGauge(name, description, unit));
  });
}

void InstrumentRegistry::AddReader(std::unique_ptr<otel_metrics::MetricReader> reader) {
  if (!reader) {
    throw std::invalid_argument("metric reader must not be null");
  }
  provider_->AddMetricReader(std::move(reader));
}

bool InstrumentRegistry::ForceFlush(std::chrono::milliseconds timeout) {
  if (shut_down_.load()) {
    return false;
  }
  return provider_->ForceFlush(std::chrono::duration_cast<std::chrono::microseconds>(timeout));
}

void InstrumentRegistry::Shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  if (!provider_->Shutdown()) {
    OP_LOG_WARN_FMT("metric readers did not shut down cleanly");
  }
}

std::size_t InstrumentRegistry::size() const {
  std::shared_lock lock(mu_);
  return instruments_.size();
}

}  // namespace otelpipe::metrics
