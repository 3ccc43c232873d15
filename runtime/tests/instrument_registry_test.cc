#include "otelpipe/metrics/instrument_registry.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "test_fakes.h"

namespace otelpipe::metrics {
namespace {

using testing::CollectingReader;
using testing::FindMetric;

class InstrumentRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto reader = std::make_unique<CollectingReader>();
    reader_ = reader.get();
    registry_.AddReader(std::move(reader));
  }

  InstrumentRegistry registry_;
  CollectingReader* reader_{nullptr};
};

TEST_F(InstrumentRegistryTest, SameNameAndKindReturnsExistingInstrument) {
  auto a = registry_.CreateCounter("requests", "first");
  auto b = registry_.CreateCounter("requests", "second");

  EXPECT_EQ(a.get(), b.get());
  EXPECT_EQ(registry_.size(), 1u);
  EXPECT_EQ(b->descriptor().description, "first");
}

TEST_F(InstrumentRegistryTest, KindMismatchThrows) {
  registry_.CreateCounter("requests");

  EXPECT_THROW(registry_.CreateHistogram("requests"), std::invalid_argument);
  EXPECT_THROW(registry_.CreateUpDownCounter("requests"), std::invalid_argument);
  EXPECT_THROW(registry_.CreateCounter(""), std::invalid_argument);
}

TEST_F(InstrumentRegistryTest, CounterIgnoresNegativeAndNaN) {
  auto counter = registry_.CreateCounter("requests");

  counter->Add(2);
  counter->Add(-5);
  counter->Add(std::numeric_limits<double>::quiet_NaN());
  counter->Add(1, {{"method", "POST"}});

  const auto batch = reader_->Take();
  const auto* requests = FindMetric(batch, "requests");
  ASSERT_NE(requests, nullptr);
  ASSERT_EQ(requests->points.size(), 2u);

  for (const auto& point : requests->points) {
    const double expected = point.labels.empty() ? 2.0 : 1.0;
    EXPECT_DOUBLE_EQ(point.value, expected);
  }
}

TEST_F(InstrumentRegistryTest, UpDownCounterGoesNegative) {
  auto gauge = registry_.CreateUpDownCounter("inflight");

  gauge->Add(3);
  gauge->Add(-5);

  const auto batch = reader_->Take();
  const auto* inflight = FindMetric(batch, "inflight");
  ASSERT_NE(inflight, nullptr);
  EXPECT_DOUBLE_EQ(inflight->points.at(0).value, -2.0);
}

TEST_F(InstrumentRegistryTest, HistogramBucketsAreUpperInclusive) {
  auto histogram = registry_.CreateHistogram("sizes", "", "By", {10, 5, 5, 20});

  EXPECT_EQ(histogram->boundaries(), (std::vector<double>{5, 10, 20}));

  histogram->Record(5);
  histogram->Record(6);
  histogram->Record(25);
  histogram->Record(std::numeric_limits<double>::quiet_NaN());

  const auto batch = reader_->Take();
  const auto* sizes = FindMetric(batch, "sizes");
  ASSERT_NE(sizes, nullptr);
  const auto& point = sizes->points.at(0);

  EXPECT_EQ(point.boundaries, (std::vector<double>{5, 10, 20}));
  EXPECT_EQ(point.counts, (std::vector<uint64_t>{1, 1, 0, 1}));
  EXPECT_EQ(point.count, 3u);
  EXPECT_DOUBLE_EQ(point.sum, 36.0);
}

TEST_F(InstrumentRegistryTest, ThrowingGaugeIsSkipped) {
  registry_.CreateCounter("requests")->Add(1);
  registry_.CreateObservableGauge("broken",
                                  [](ObserverResult&) { throw std::runtime_error("sensor down"); });
  registry_.CreateObservableGauge("cpu", [](ObserverResult& result) { result.Observe(0.5); });

  const auto batch = reader_->Take();

  const auto* broken = FindMetric(batch, "broken");
  EXPECT_TRUE(broken == nullptr || broken->points.empty());
  ASSERT_NE(FindMetric(batch, "requests"), nullptr);
  ASSERT_NE(FindMetric(batch, "cpu"), nullptr);
  EXPECT_DOUBLE_EQ(FindMetric(batch, "cpu")->points.at(0).value, 0.5);
}

TEST_F(InstrumentRegistryTest, ConcurrentRecordingLosesNothing) {
  auto counter = registry_.CreateCounter("requests");

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 1000; ++i) {
        counter->Add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto batch = reader_->Take();
  const auto* requests = FindMetric(batch, "requests");
  ASSERT_NE(requests, nullptr);
  EXPECT_DOUBLE_EQ(requests->points.at(0).value, 4000.0);
}

TEST_F(InstrumentRegistryTest, RecordingAfterShutdownIsDropped) {
  auto counter = registry_.CreateCounter("requests");
  registry_.Shutdown();
  registry_.Shutdown();

  counter->Add(1);

  EXPECT_TRUE(reader_->Take().empty());
}

}  // namespace
}  // namespace otelpipe::metrics
