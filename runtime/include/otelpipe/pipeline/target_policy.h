#pragma once

#include <opentelemetry/sdk/metrics/instruments.h>

#include <memory>
#include <optional>
#include <string_view>

#include "otelpipe/config.h"
#include "otelpipe/level_filter.h"
#include "otelpipe/severity.h"

namespace otelpipe::pipeline {

// Aggregation temporality a metric target asks for, per instrument kind.
class TemporalityPolicy {
 public:
  explicit TemporalityPolicy(Temporality preferred = Temporality::Cumulative)
      : preferred_(preferred) {}

  // Cumulative when the target leaves temporality unset.
  static TemporalityPolicy ForTarget(const MetricTarget& target);

  // Sums and histograms follow the preferred temporality. Observable
  // gauges report their last value and are always Cumulative.
  opentelemetry::sdk::metrics::AggregationTemporality For(
      opentelemetry::sdk::metrics::InstrumentType type) const noexcept;

  Temporality preferred() const noexcept {
    return preferred_;
  }

 private:
  Temporality preferred_;
};

// (module, severity) predicate of one log target: the global level
// filter combined with the target's optional minimum severity.
class LogFilterPolicy {
 public:
  LogFilterPolicy(std::shared_ptr<const LevelFilter> global, std::optional<Severity> minimum);

  static LogFilterPolicy ForTarget(const LogTarget& target,
                                   std::shared_ptr<const LevelFilter> global);

  bool Accepts(std::string_view module, Severity severity) const noexcept;

 private:
  std::shared_ptr<const LevelFilter> global_;
  std::optional<Severity> minimum_;
};

}  // namespace otelpipe::pipeline
