#pragma once

#include <opentelemetry/metrics/meter.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/metric_reader.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "otelpipe/metrics/instruments.h"
#include "otelpipe/resource.h"

namespace otelpipe::metrics {

// ------------------------------------------------------------
// InstrumentRegistry
// ------------------------------------------------------------
// Process-wide set of named instruments, backed by one SDK MeterProvider
// carrying the resource.
//
// - Created once by Otel and shared (std::shared_ptr) with the
//   application. It is not installed as the global MeterProvider.
// - Names are unique. Creating an instrument whose name already exists
//   returns the existing instrument if the kind matches and throws
//   std::invalid_argument otherwise.
// - Every reader (one per push target, one for the scrape endpoint) is
//   attached with AddReader and keeps its own aggregation state, so
//   delta and cumulative targets never share baselines. Attach readers
//   before creating instruments: a reader added later does not see what
//   was recorded earlier.
// - Instrument handles stay valid for the registry's lifetime. After
//   Shutdown recordings are accepted and dropped.
//
class InstrumentRegistry {
 public:
  InstrumentRegistry();
  explicit InstrumentRegistry(const Resource& resource);
  ~InstrumentRegistry();

  InstrumentRegistry(const InstrumentRegistry&) = delete;
  InstrumentRegistry& operator=(const InstrumentRegistry&) = delete;

  std::shared_ptr<Counter> CreateCounter(const std::string& name,
                                         const std::string& description = "",
                                         const std::string& unit = "");

  std::shared_ptr<UpDownCounter> CreateUpDownCounter(const std::string& name,
                                                     const std::string& description = "",
                                                     const std::string& unit = "");

  std::shared_ptr<Histogram> CreateHistogram(
      const std::string& name, const std::string& description = "", const std::string& unit = "",
      std::vector<double> boundaries = DefaultHistogramBoundaries());

  std::shared_ptr<ObservableGauge> CreateObservableGauge(const std::string& name,
                                                         ObservableGauge::Callback callback,
                                                         const std::string& description = "",
                                                         const std::string& unit = "");

  // Hands `reader` to the provider, which owns it from then on. Periodic
  // readers start their export thread here.
  void AddReader(std::unique_ptr<opentelemetry::sdk::metrics::MetricReader> reader);

  // Collects and pushes through every reader.
  bool ForceFlush(std::chrono::milliseconds timeout);

  // Stops every reader without a last push; flush first to send what is
  // pending. Idempotent.
  void Shutdown();

  std::size_t size() const;

 private:
  template <typename T, typename Factory>
  std::shared_ptr<T> GetOrCreate(const std::string& name, InstrumentKind kind, Factory&& factory);

  std::shared_ptr<opentelemetry::sdk::metrics::MeterProvider> provider_;
  opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Meter> meter_;
  std::atomic<bool> shut_down_{false};

  mutable std::shared_mutex mu_;
  std::vector<std::shared_ptr<Instrument>> instruments_;  // registration order
};

}  // namespace otelpipe::metrics
