#pragma once

#include <opentelemetry/common/key_value_iterable.h>
#include <opentelemetry/metrics/async_instruments.h>
#include <opentelemetry/metrics/observer_result.h>
#include <opentelemetry/metrics/sync_instruments.h>
#include <opentelemetry/nostd/shared_ptr.h>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace otelpipe::metrics {

// Label set of a single recorded point. Ordered so that two equal sets
// always render identically.
using Labels = std::map<std::string, std::string>;

enum class InstrumentKind { Counter, UpDownCounter, Histogram, ObservableGauge };

struct InstrumentDescriptor {
  std::string name;
  std::string description;
  std::string unit;
  InstrumentKind kind;
};

// Default explicit bucket boundaries used by OpenTelemetry SDKs.
const std::vector<double>& DefaultHistogramBoundaries();

// Sorted, deduplicated, non-finite values dropped.
std::vector<double> NormalizeBoundaries(std::vector<double> boundaries);

// Presents a Labels map to the OpenTelemetry API without copying it.
// The map must outlive the view.
class LabelsView final : public opentelemetry::common::KeyValueIterable {
 public:
  explicit LabelsView(const Labels& labels) noexcept : labels_(labels) {}

  bool ForEachKeyValue(
      opentelemetry::nostd::function_ref<bool(opentelemetry::nostd::string_view,
                                              opentelemetry::common::AttributeValue)>
          callback) const noexcept override;

  size_t size() const noexcept override {
    return labels_.size();
  }

 private:
  const Labels& labels_;
};

// ------------------------------------------------------------
// Instrument
// ------------------------------------------------------------
// Base of all registry instruments. Each one is a handle over an
// OpenTelemetry SDK instrument; aggregation lives in the SDK's metric
// storage, which keeps one accumulator per reader.
//
class Instrument {
 public:
  explicit Instrument(InstrumentDescriptor descriptor) : descriptor_(std::move(descriptor)) {}
  virtual ~Instrument() = default;

  Instrument(const Instrument&) = delete;
  Instrument& operator=(const Instrument&) = delete;

  const InstrumentDescriptor& descriptor() const noexcept {
    return descriptor_;
  }

 private:
  InstrumentDescriptor descriptor_;
};

// Monotonic sum. Negative and NaN increments are ignored.
class Counter final : public Instrument {
 public:
  Counter(InstrumentDescriptor descriptor,
          opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Counter<double>> counter);

  void Add(double value, const Labels& labels = {});

 private:
  opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Counter<double>> counter_;
};

// Non-monotonic sum.
class UpDownCounter final : public Instrument {
 public:
  UpDownCounter(
      InstrumentDescriptor descriptor,
      opentelemetry::nostd::shared_ptr<opentelemetry::metrics::UpDownCounter<double>> counter);

  void Add(double value, const Labels& labels = {});

 private:
  opentelemetry::nostd::shared_ptr<opentelemetry::metrics::UpDownCounter<double>> counter_;
};

// Explicit-bucket histogram. Buckets are upper-inclusive; the boundaries
// are fixed by a view registered before the SDK instrument is created.
class Histogram final : public Instrument {
 public:
  Histogram(InstrumentDescriptor descriptor, std::vector<double> boundaries,
            opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Histogram<double>> histogram);

  void Record(double value, const Labels& labels = {});

  const std::vector<double>& boundaries() const noexcept {
    return boundaries_;
  }

 private:
  std::vector<double> boundaries_;
  opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Histogram<double>> histogram_;
};

// Collects the values reported by an observable callback. Observing the
// same label set twice keeps the last value.
class ObserverResult {
 public:
  void Observe(double value, const Labels& labels = {});

  std::vector<std::pair<Labels, double>> Take() {
    return std::move(points_);
  }

 private:
  std::vector<std::pair<Labels, double>> points_;
};

// ------------------------------------------------------------
// ObservableGauge
// ------------------------------------------------------------
// Gauge sampled through a callback whenever a reader collects. The
// callback may run on any reader's thread; calls are serialized.
// A callback that throws is logged and contributes no points to that
// collection.
//
class ObservableGauge final : public Instrument {
 public:
  using Callback = std::function<void(ObserverResult&)>;

  ObservableGauge(
      InstrumentDescriptor descriptor, Callback callback,
      opentelemetry::nostd::shared_ptr<opentelemetry::metrics::ObservableInstrument> instrument);
  ~ObservableGauge() override;

 private:
  static void Observe(opentelemetry::metrics::ObserverResult result, void* state);

  std::mutex mu_;
  Callback callback_;
  opentelemetry::nostd::shared_ptr<opentelemetry::metrics::ObservableInstrument> instrument_;
};

}  // namespace otelpipe::metrics
