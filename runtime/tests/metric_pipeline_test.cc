#include "otelpipe/pipeline/metric_pipeline.h"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "otelpipe/exporters/stdout_metric_exporter.h"
#include "test_fakes.h"

namespace otelpipe::pipeline {
namespace {

using namespace std::chrono_literals;
using opentelemetry::sdk::metrics::AggregationTemporality;
using testing::FakeMetricExporter;
using testing::MetricRecorder;
using testing::TotalOf;

PipelineOptions Options(std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
  return PipelineOptions{.name = "test", .interval = interval, .timeout = timeout};
}

bool WaitUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!done()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

TEST(MetricPipelineTest, PushesEveryInterval) {
  metrics::InstrumentRegistry registry;
  auto recorder = std::make_shared<MetricRecorder>();

  MetricPipeline pipeline(Options(50ms, 40ms), TemporalityPolicy(),
                          std::make_unique<FakeMetricExporter>(recorder));
  pipeline.AttachTo(registry);
  registry.CreateCounter("requests")->Add(3);

  ASSERT_TRUE(recorder->WaitForBatches(3, 5s));
  const auto batches = recorder->Batches();
  EXPECT_EQ(TotalOf(batches.back(), "requests"), 3.0);
  EXPECT_GE(pipeline.stats().exports, 2u);
}

TEST(MetricPipelineTest, FailureIsCountedNotThrown) {
  metrics::InstrumentRegistry registry;
  auto recorder = std::make_shared<MetricRecorder>();
  recorder->fail = true;

  MetricPipeline pipeline(Options(30ms, 20ms), TemporalityPolicy(),
                          std::make_unique<FakeMetricExporter>(recorder));
  pipeline.AttachTo(registry);
  registry.CreateCounter("requests")->Add(1);

  EXPECT_TRUE(WaitUntil([&] { return pipeline.stats().failed >= 2; }, 5s));
  EXPECT_EQ(pipeline.stats().failed, pipeline.stats().exports);
}

TEST(MetricPipelineTest, FlushPushesNow) {
  metrics::InstrumentRegistry registry;
  auto recorder = std::make_shared<MetricRecorder>();

  MetricPipeline pipeline(Options(1h, 1s), TemporalityPolicy(),
                          std::make_unique<FakeMetricExporter>(recorder));
  EXPECT_FALSE(pipeline.Flush());

  pipeline.AttachTo(registry);
  registry.CreateCounter("requests")->Add(2);

  EXPECT_TRUE(pipeline.Flush());
  ASSERT_EQ(recorder->Batches().size(), 1u);
  EXPECT_EQ(TotalOf(recorder->Batches().at(0), "requests"), 2.0);
}

TEST(MetricPipelineTest, DeltaTargetGetsIncrementsSinceItsLastPush) {
  metrics::InstrumentRegistry registry;
  auto recorder = std::make_shared<MetricRecorder>();

  MetricPipeline pipeline(Options(1h, 1s), TemporalityPolicy(Temporality::Delta),
                          std::make_unique<FakeMetricExporter>(recorder));
  pipeline.AttachTo(registry);
  auto counter = registry.CreateCounter("requests");

  counter->Add(3);
  ASSERT_TRUE(pipeline.Flush());
  counter->Add(2);
  ASSERT_TRUE(pipeline.Flush());

  const auto batches = recorder->Batches();
  ASSERT_EQ(batches.size(), 2u);
  EXPECT_EQ(TotalOf(batches[0], "requests"), 3.0);
  EXPECT_EQ(TotalOf(batches[1], "requests"), 2.0);
  EXPECT_EQ(testing::FindMetric(batches[1], "requests")->temporality,
            AggregationTemporality::kDelta);
}

TEST(MetricPipelineTest, AttachTwiceThrows) {
  metrics::InstrumentRegistry registry;
  auto recorder = std::make_shared<MetricRecorder>();
  MetricPipeline pipeline(Options(1h, 1s), TemporalityPolicy(),
                          std::make_unique<FakeMetricExporter>(recorder));

  pipeline.AttachTo(registry);
  EXPECT_THROW(pipeline.AttachTo(registry), std::logic_error);
}

TEST(MetricPipelineTest, NullExporterThrows) {
  EXPECT_THROW(MetricPipeline(Options(1s, 1s), TemporalityPolicy(), nullptr),
               std::invalid_argument);
}

TEST(MetricPipelineTest, SlowTargetDoesNotDelayAnother) {
  metrics::InstrumentRegistry registry;
  auto slow = std::make_shared<MetricRecorder>();
  slow->block_for = 3s;
  auto fast = std::make_shared<MetricRecorder>();

  MetricPipeline slow_pipeline(Options(50ms, 40ms), TemporalityPolicy(),
                               std::make_unique<FakeMetricExporter>(slow));
  MetricPipeline fast_pipeline(Options(50ms, 40ms), TemporalityPolicy(),
                               std::make_unique<FakeMetricExporter>(fast));
  slow_pipeline.AttachTo(registry);
  fast_pipeline.AttachTo(registry);
  registry.CreateCounter("requests")->Add(1);

  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(fast->WaitForBatches(5, 2s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_LE(slow->calls.load(), 1);

  slow->Unblock();
  registry.Shutdown();
}

TEST(MetricPipelineTest, StdoutExporterPrintsEachMetricAsJson) {
  metrics::InstrumentRegistry registry;
  std::ostringstream out;

  MetricPipeline pipeline(Options(1h, 1s), TemporalityPolicy(),
                          std::make_unique<exporters::StdoutMetricExporter>(&out));
  pipeline.AttachTo(registry);
  registry.CreateCounter("requests")->Add(2);
  registry.CreateUpDownCounter("inflight")->Add(-1);

  ASSERT_TRUE(pipeline.Flush());
  const std::string text = out.str();
  EXPECT_NE(text.find("\"name\": \"requests\""), std::string::npos);
  EXPECT_NE(text.find("\"name\": \"inflight\""), std::string::npos);
}

TEST(ReaderOptionsTest, TimeoutStaysBelowInterval) {
  const auto capped = ReaderOptions(Options(10s, 30s));
  EXPECT_EQ(capped.export_interval_millis, 10s);
  EXPECT_EQ(capped.export_timeout_millis, 9s);

  const auto kept = ReaderOptions(Options(10s, 2s));
  EXPECT_EQ(kept.export_interval_millis, 10s);
  EXPECT_EQ(kept.export_timeout_millis, 2s);
}

}  // namespace
}  // namespace otelpipe::pipeline
