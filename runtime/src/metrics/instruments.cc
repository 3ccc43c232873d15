#include "otelpipe/metrics/instruments.h"

#include <opentelemetry/context/context.h>
#include <opentelemetry/nostd/variant.h>

#include <algorithm>
#include <cmath>
#include <exception>

#include "otelpipe/observability/logging.h"

namespace otel_api = opentelemetry::metrics;
namespace nostd = opentelemetry::nostd;

namespace otelpipe::metrics {

const std::vector<double>& DefaultHistogramBoundaries() {
  static const std::vector<double> boundaries{0,   5,    10,   25,   50,   75,   100,  250,
                                              500, 750, 1000, 2500, 5000, 7500, 10000};
  return boundaries;
}

std::vector<double> NormalizeBoundaries(std::vector<double> boundaries) {
  boundaries.erase(std::remove_if(boundaries.begin(), boundaries.end(),
                                  [](double b) { return !std::isfinite(b); }),
                   boundaries.end());
  std::sort(boundaries.begin(), boundaries.end());
  boundaries.erase(std::unique(boundaries.begin(), boundaries.end()), boundaries.end());
  return boundaries;
}

bool LabelsView::ForEachKeyValue(
    nostd::function_ref<bool(nostd::string_view, opentelemetry::common::AttributeValue)> callback)
    const noexcept {
  for (const auto& [key, value] : labels_) {
    if (!callback(nostd::string_view(key), nostd::string_view(value))) {
      return false;
    }
  }
  return true;
}

// ------------------------------------------------------------
// Sums
// ------------------------------------------------------------
Counter::Counter(InstrumentDescriptor descriptor,
                 nostd::shared_ptr<otel_api::Counter<double>> counter)
    : Instrument(std::move(descriptor)), counter_(std::move(counter)) {}

void Counter::Add(double value, const Labels& labels) {
  // Monotonic: a negative or NaN increment would break cumulative readers.
  if (!(value >= 0)) {
    return;
  }
  counter_->Add(value, LabelsView(labels));
}

UpDownCounter::UpDownCounter(InstrumentDescriptor descriptor,
                             nostd::shared_ptr<otel_api::UpDownCounter<double>> counter)
    : Instrument(std::move(descriptor)), counter_(std::move(counter)) {}

void UpDownCounter::Add(double value, const Labels& labels) {
  if (std::isnan(value)) {
    return;
  }
  counter_->Add(value, LabelsView(labels));
}

// ------------------------------------------------------------
// Histogram
// ------------------------------------------------------------
Histogram::Histogram(InstrumentDescriptor descriptor, std::vector<double> boundaries,
                     nostd::shared_ptr<otel_api::Histogram<double>> histogram)
    : Instrument(std::move(descriptor)),
      boundaries_(std::move(boundaries)),
      histogram_(std::move(histogram)) {}

void Histogram::Record(double value, const Labels& labels) {
  if (std::isnan(value)) {
    return;
  }
  histogram_->Record(value, LabelsView(labels), opentelemetry::context::Context{});
}

// ------------------------------------------------------------
// Observable gauge
// ------------------------------------------------------------
void ObserverResult::Observe(double value, const Labels& labels) {
  for (auto& point : points_) {
    if (point.first == labels) {
      point.second = value;
      return;
    }
  }
  points_.emplace_back(labels, value);
}

ObservableGauge::ObservableGauge(InstrumentDescriptor descriptor, Callback callback,
                                 nostd::shared_ptr<otel_api::ObservableInstrument> instrument)
    : Instrument(std::move(descriptor)),
      callback_(std::move(callback)),
      instrument_(std::move(instrument)) {
  instrument_->AddCallback(&ObservableGauge::Observe, this);
}

ObservableGauge::~ObservableGauge() {
  instrument_->RemoveCallback(&ObservableGauge::Observe, this);
}

void ObservableGauge::Observe(otel_api::ObserverResult result, void* state) {
  auto* self = static_cast<ObservableGauge*>(state);

  ObserverResult observed;
  {
    // Callbacks are not required to be reentrant.
    std::lock_guard lock(self->mu_);
    if (!self->callback_) {
      return;
    }
    try {
      self->callback_(observed);
    } catch (const std::exception& e) {
      OP_LOG_ERROR_FMT("observable gauge '{}' callback failed: {}", self->descriptor().name,
                       e.what());
      return;
    }
  }

  using DoubleResult = nostd::shared_ptr<otel_api::ObserverResultT<double>>;
  if (!nostd::holds_alternative<DoubleResult>(result)) {
    return;
  }
  auto& observer = nostd::get<DoubleResult>(result);
  for (const auto& [labels, value] : observed.Take()) {
    observer->Observe(value, LabelsView(labels));
  }
}

}  // namespace otelpipe::metrics
