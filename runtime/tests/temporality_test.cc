#include <gtest/gtest.h>

#include <memory>

#include "otelpipe/metrics/instrument_registry.h"
#include "otelpipe/pipeline/target_policy.h"
#include "test_fakes.h"

namespace otelpipe::pipeline {
namespace {

using opentelemetry::sdk::metrics::AggregationTemporality;
using opentelemetry::sdk::metrics::InstrumentType;
using testing::CollectingReader;
using testing::FindMetric;
using testing::TotalOf;

class TemporalityTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto cumulative = std::make_unique<CollectingReader>(AggregationTemporality::kCumulative);
    auto delta = std::make_unique<CollectingReader>(AggregationTemporality::kDelta);
    cumulative_ = cumulative.get();
    delta_ = delta.get();
    registry_.AddReader(std::move(cumulative));
    registry_.AddReader(std::move(delta));
  }

  metrics::InstrumentRegistry registry_;
  CollectingReader* cumulative_{nullptr};
  CollectingReader* delta_{nullptr};
};

TEST_F(TemporalityTest, DeltasSumToCumulativeTotal) {
  auto counter = registry_.CreateCounter("requests");
  double delta_total = 0;
  double last_cumulative = 0;

  for (int round = 1; round <= 5; ++round) {
    counter->Add(round);

    const auto delta = TotalOf(delta_->Take(), "requests");
    ASSERT_TRUE(delta.has_value());
    EXPECT_DOUBLE_EQ(*delta, round);
    delta_total += *delta;

    const auto cumulative = TotalOf(cumulative_->Take(), "requests");
    ASSERT_TRUE(cumulative.has_value());
    EXPECT_GE(*cumulative, last_cumulative);
    last_cumulative = *cumulative;
  }

  EXPECT_DOUBLE_EQ(delta_total, 15.0);
  EXPECT_DOUBLE_EQ(last_cumulative, 15.0);
}

TEST_F(TemporalityTest, ReadersKeepIndependentBaselines) {
  auto counter = registry_.CreateCounter("requests");

  counter->Add(4);
  // Only the cumulative reader collects here; the delta baseline stays put.
  EXPECT_EQ(TotalOf(cumulative_->Take(), "requests"), 4.0);
  counter->Add(1);

  EXPECT_EQ(TotalOf(delta_->Take(), "requests"), 5.0);
  EXPECT_EQ(TotalOf(cumulative_->Take(), "requests"), 5.0);
}

TEST_F(TemporalityTest, DeltaHistogramResetsBetweenCollections) {
  auto histogram = registry_.CreateHistogram("latency", "", "ms", {10, 100});

  histogram->Record(5);
  histogram->Record(50);
  auto batch = delta_->Take();
  ASSERT_NE(FindMetric(batch, "latency"), nullptr);
  EXPECT_EQ(FindMetric(batch, "latency")->points.at(0).count, 2u);

  histogram->Record(500);
  batch = delta_->Take();
  const auto& point = FindMetric(batch, "latency")->points.at(0);
  EXPECT_EQ(point.count, 1u);
  EXPECT_EQ(point.counts, (std::vector<uint64_t>{0, 0, 1}));

  const auto cumulative = cumulative_->Take();
  EXPECT_EQ(FindMetric(cumulative, "latency")->points.at(0).count, 3u);
}

TEST(TemporalityPolicyTest, GaugesStayCumulative) {
  const TemporalityPolicy delta(Temporality::Delta);

  EXPECT_EQ(delta.For(InstrumentType::kCounter), AggregationTemporality::kDelta);
  EXPECT_EQ(delta.For(InstrumentType::kUpDownCounter), AggregationTemporality::kDelta);
  EXPECT_EQ(delta.For(InstrumentType::kHistogram), AggregationTemporality::kDelta);
  EXPECT_EQ(delta.For(InstrumentType::kObservableGauge), AggregationTemporality::kCumulative);

  const TemporalityPolicy cumulative;
  EXPECT_EQ(cumulative.For(InstrumentType::kCounter), AggregationTemporality::kCumulative);
  EXPECT_EQ(cumulative.For(InstrumentType::kHistogram), AggregationTemporality::kCumulative);
}

TEST(TemporalityPolicyTest, UnsetTargetTemporalityIsCumulative) {
  MetricTarget target;
  EXPECT_EQ(TemporalityPolicy::ForTarget(target).preferred(), Temporality::Cumulative);

  target.temporality = Temporality::Delta;
  EXPECT_EQ(TemporalityPolicy::ForTarget(target).preferred(), Temporality::Delta);
}

}  // namespace
}  // namespace otelpipe::pipeline
