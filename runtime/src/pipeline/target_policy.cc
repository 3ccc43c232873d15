#include "otelpipe/pipeline/target_policy.h"

#include <utility>

namespace otel_metrics = opentelemetry::sdk::metrics;

namespace otelpipe::pipeline {

TemporalityPolicy TemporalityPolicy::ForTarget(const MetricTarget& target) {
  return TemporalityPolicy(target.temporality.value_or(Temporality::Cumulative));
}

otel_metrics::AggregationTemporality TemporalityPolicy::For(
    otel_metrics::InstrumentType type) const noexcept {
  if (type == otel_metrics::InstrumentType::kObservableGauge ||
      preferred_ == Temporality::Cumulative) {
    return otel_metrics::AggregationTemporality::kCumulative;
  }
  return otel_metrics::AggregationTemporality::kDelta;
}

LogFilterPolicy::LogFilterPolicy(std::shared_ptr<const LevelFilter> global,
                                 std::optional<Severity> minimum)
    : global_(std::move(global)), minimum_(minimum) {}

LogFilterPolicy LogFilterPolicy::ForTarget(const LogTarget& target,
                                           std::shared_ptr<const LevelFilter> global) {
  return LogFilterPolicy(std::move(global), target.export_severity);
}

bool LogFilterPolicy::Accepts(std::string_view module, Severity severity) const noexcept {
  if (minimum_ && severity < *minimum_) {
    return false;
  }
  return !global_ || global_->Enabled(module, severity);
}

}  // namespace otelpipe::pipeline
