#include "otelpipe/pipeline/log_pipeline.h"

#include <gtest/gtest.h>
#include <opentelemetry/sdk/logs/logger_provider.h>
#include <opentelemetry/sdk/logs/simple_log_record_processor.h>

#include <array>
#include <chrono>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "otelpipe/exporters/otel_conversion.h"
#include "test_fakes.h"

namespace otelpipe::pipeline {
namespace {

using namespace std::chrono_literals;
using testing::FakeLogExporter;
using testing::LogRecorder;

namespace otel_logs = opentelemetry::sdk::logs;

LogFilterPolicy Policy(const std::string& level, std::optional<Severity> minimum = std::nullopt) {
  return LogFilterPolicy(std::make_shared<LevelFilter>(LevelFilter::Parse(level)), minimum);
}

LogPipelineOptions Options(std::size_t queue = 2048, std::size_t batch = 512) {
  LogPipelineOptions options;
  options.base = PipelineOptions{.name = "test", .interval = 1h, .timeout = 1s};
  options.max_queue_size = queue;
  options.max_export_batch_size = batch;
  return options;
}

// Logger provider over the given processors, emitting the way the log
// bridge does.
class Emitter {
 public:
  explicit Emitter(std::unique_ptr<otel_logs::LogRecordProcessor> processor) {
    std::vector<std::unique_ptr<otel_logs::LogRecordProcessor>> processors;
    processors.push_back(std::move(processor));
    provider_ = std::make_shared<otel_logs::LoggerProvider>(std::move(processors));
    logger_ = provider_->GetLogger("test");
  }

  void Emit(Severity severity, std::string body, std::string module = "app") {
    exporters::EmitLogRecord(*logger_, observability::LogRecord{
                                           .timestamp = std::chrono::system_clock::now(),
                                           .severity = severity,
                                           .module = std::move(module),
                                           .body = std::move(body),
                                       });
  }

  bool Flush() {
    return provider_->ForceFlush();
  }

 private:
  std::shared_ptr<otel_logs::LoggerProvider> provider_;
  opentelemetry::nostd::shared_ptr<opentelemetry::logs::Logger> logger_;
};

std::unique_ptr<otel_logs::LogRecordProcessor> Filtering(LogFilterPolicy policy,
                                                         std::shared_ptr<LogRecorder> recorder,
                                                         std::shared_ptr<ExportCounters> counters) {
  return std::make_unique<FilteringLogRecordProcessor>(
      std::move(policy),
      std::make_unique<otel_logs::SimpleLogRecordProcessor>(
          std::make_unique<FakeLogExporter>(std::move(recorder))),
      std::move(counters));
}

TEST(FilteringLogRecordProcessorTest, ErrorTargetGetsExactlyTheErrorsInOrder) {
  constexpr std::array<Severity, 5> kSeverities = {Severity::Trace, Severity::Debug, Severity::Info,
                                                   Severity::Warn, Severity::Error};
  constexpr std::array<const char*, 3> kModules = {"app", "db", "net"};

  auto recorder = std::make_shared<LogRecorder>();
  auto counters = std::make_shared<ExportCounters>();
  Emitter emitter(Filtering(Policy("trace", Severity::Error), recorder, counters));

  std::mt19937 rng(20261019);
  std::uniform_int_distribution<std::size_t> pick_severity(0, kSeverities.size() - 1);
  std::uniform_int_distribution<std::size_t> pick_module(0, kModules.size() - 1);

  std::vector<std::string> expected;
  constexpr int kRecords = 1000;
  for (int i = 0; i < kRecords; ++i) {
    const Severity severity = kSeverities[pick_severity(rng)];
    const std::string body = std::to_string(i);
    if (severity == Severity::Error) {
      expected.push_back(body);
    }
    emitter.Emit(severity, body, kModules[pick_module(rng)]);
  }
  ASSERT_FALSE(expected.empty());

  std::vector<std::string> received;
  for (const auto& log : recorder->Received()) {
    EXPECT_EQ(log.severity, opentelemetry::logs::Severity::kError);
    received.push_back(log.body);
  }
  EXPECT_EQ(received, expected);
  EXPECT_EQ(counters->Snapshot().filtered, kRecords - expected.size());
}

TEST(FilteringLogRecordProcessorTest, GlobalFilterAppliesPerModule) {
  auto recorder = std::make_shared<LogRecorder>();
  Emitter emitter(Filtering(Policy("info,grpc=off"), recorder, nullptr));

  emitter.Emit(Severity::Error, "dropped", "grpc");
  emitter.Emit(Severity::Info, "kept", "app");
  emitter.Emit(Severity::Debug, "too verbose", "app");

  const auto received = recorder->Received();
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].body, "kept");
  EXPECT_EQ(received[0].module, "app");
}

TEST(FilteringLogRecordProcessorTest, NullInnerProcessorThrows) {
  EXPECT_THROW(FilteringLogRecordProcessor(Policy("info"), nullptr, nullptr),
               std::invalid_argument);
}

TEST(LogPipelineTest, FlushSendsBufferedRecordsInBatches) {
  auto recorder = std::make_shared<LogRecorder>();
  LogPipeline pipeline(Options(2048, 4), Policy("trace"),
                       std::make_unique<FakeLogExporter>(recorder));
  Emitter emitter(pipeline.ReleaseProcessor());

  for (int i = 0; i < 10; ++i) {
    emitter.Emit(Severity::Info, std::to_string(i));
  }
  EXPECT_TRUE(emitter.Flush());

  const auto received = recorder->Received();
  ASSERT_EQ(received.size(), 10u);
  for (std::size_t i = 0; i < received.size(); ++i) {
    EXPECT_EQ(received[i].body, std::to_string(i));
  }
  for (const auto size : recorder->BatchSizes()) {
    EXPECT_LE(size, 4u);
  }
  EXPECT_GE(pipeline.stats().exports, 3u);
}

TEST(LogPipelineTest, FullBufferDropsNewest) {
  auto recorder = std::make_shared<LogRecorder>();
  recorder->block_for = 100ms;
  LogPipeline pipeline(Options(8, 4), Policy("trace"),
                       std::make_unique<FakeLogExporter>(recorder));
  Emitter emitter(pipeline.ReleaseProcessor());

  constexpr int kRecords = 200;
  for (int i = 0; i < kRecords; ++i) {
    emitter.Emit(Severity::Info, std::to_string(i));
  }
  emitter.Flush();

  const auto received = recorder->Received();
  ASSERT_FALSE(received.empty());
  EXPECT_LT(received.size(), static_cast<std::size_t>(kRecords));
  EXPECT_EQ(received.front().body, "0");
  for (std::size_t i = 1; i < received.size(); ++i) {
    EXPECT_LT(std::stoi(received[i - 1].body), std::stoi(received[i].body));
  }
}

TEST(LogPipelineTest, FailedBatchIsCountedAndNotReplayed) {
  auto recorder = std::make_shared<LogRecorder>();
  recorder->fail = true;
  LogPipeline pipeline(Options(2048, 4), Policy("trace"),
                       std::make_unique<FakeLogExporter>(recorder));
  Emitter emitter(pipeline.ReleaseProcessor());

  for (int i = 0; i < 10; ++i) {
    emitter.Emit(Severity::Info, std::to_string(i));
  }
  emitter.Flush();

  const int calls = recorder->calls.load();
  EXPECT_GE(calls, 3);
  EXPECT_TRUE(recorder->Received().empty());
  EXPECT_EQ(pipeline.stats().failed, static_cast<uint64_t>(calls));

  recorder->fail = false;
  emitter.Flush();
  EXPECT_EQ(recorder->calls.load(), calls);
}

TEST(LogPipelineTest, ExportsOnItsInterval) {
  auto recorder = std::make_shared<LogRecorder>();
  auto options = Options();
  options.base.interval = 20ms;
  LogPipeline pipeline(options, Policy("trace"), std::make_unique<FakeLogExporter>(recorder));
  Emitter emitter(pipeline.ReleaseProcessor());

  emitter.Emit(Severity::Info, "one");
  EXPECT_TRUE(recorder->WaitForRecords(1, 2s));
  emitter.Emit(Severity::Info, "two");
  EXPECT_TRUE(recorder->WaitForRecords(2, 2s));
}

TEST(LogPipelineTest, ReleaseTwiceThrows) {
  LogPipeline pipeline(Options(), Policy("trace"),
                       std::make_unique<FakeLogExporter>(std::make_shared<LogRecorder>()));

  auto processor = pipeline.ReleaseProcessor();
  ASSERT_NE(processor, nullptr);
  EXPECT_THROW(pipeline.ReleaseProcessor(), std::logic_error);
}

TEST(LogPipelineTest, NullExporterThrows) {
  EXPECT_THROW(LogPipeline(Options(), Policy("trace"), nullptr), std::invalid_argument);
}

}  // namespace
}  // namespace otelpipe::pipeline
