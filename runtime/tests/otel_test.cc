#include "otelpipe/otel.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "otelpipe/observability/log_bridge.h"
#include "otelpipe/observability/logging.h"
#include "otelpipe/setup_error.h"
#include "test_fakes.h"

namespace otelpipe {
namespace {

using namespace std::chrono_literals;
using testing::FakeExporterFactory;

Config QuietConfig() {
  Config config;
  config.service_name = "otel-test";
  config.emit_logs_to_stderr = false;
  return config;
}

bool CanConnect(uint16_t port) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  const bool ok = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  ::close(fd);
  return ok;
}

TEST(OtelTest, InvalidConfigurationIsSetupError) {
  auto factory = std::make_shared<FakeExporterFactory>();

  Config empty_name = QuietConfig();
  empty_name.service_name = "";
  EXPECT_THROW(Otel(empty_name, factory), SetupError);

  Config bad_level = QuietConfig();
  bad_level.level = "info,db=loud";
  EXPECT_THROW(Otel(bad_level, factory), SetupError);

  Config bad_regex = QuietConfig();
  bad_regex.regex_filters.push_back(RegexFilter{"[", "x"});
  EXPECT_THROW(Otel(bad_regex, factory), SetupError);

  EXPECT_FALSE(observability::GetLogRouter()->attached());
}

TEST(OtelTest, BusyScrapePortIsSetupError) {
  scrape::ScrapeServer holder(0, [] { return std::string(); });

  Config config = QuietConfig();
  config.prometheus_config = PrometheusConfig{holder.port()};

  EXPECT_THROW(Otel(config, std::make_shared<FakeExporterFactory>()), SetupError);
}

TEST(OtelTest, TargetWithInvalidEndpointIsSkipped) {
  auto factory = std::make_shared<FakeExporterFactory>();
  Config config = QuietConfig();
  config.metrics_export_targets.push_back(MetricTarget{.url = "http://invalid"});
  config.metrics_export_targets.push_back(MetricTarget{.url = "http://collector:4317"});
  config.log_export_targets.push_back(LogTarget{.url = "http://invalid"});

  Otel otel(config, factory);

  EXPECT_EQ(otel.metric_pipeline_count(), 1u);
  EXPECT_EQ(otel.log_pipeline_count(), 0u);
  EXPECT_EQ(otel.metric_pipeline_stats().at(0).name, "http://collector:4317");
}

TEST(OtelTest, StdoutMirrorAddsOnePipeline) {
  auto factory = std::make_shared<FakeExporterFactory>();
  Config config = QuietConfig();
  config.emit_metrics_to_stdout = true;
  config.metrics_export_targets.push_back(
      MetricTarget{.url = "http://a:4317", .interval_secs = 10, .timeout = 5});
  config.metrics_export_targets.push_back(
      MetricTarget{.url = "http://b:4317", .interval_secs = 5, .timeout = 5});

  Otel otel(config, factory);

  const auto stats = otel.metric_pipeline_stats();
  ASSERT_EQ(stats.size(), 3u);
  EXPECT_EQ(stats.back().name, "stdout");
  ASSERT_NE(factory->stdout_recorder, nullptr);
}

TEST(OtelTest, ShutdownPushesPendingMetricsAndLogs) {
  auto factory = std::make_shared<FakeExporterFactory>();
  Config config = QuietConfig();
  config.metrics_export_targets.push_back(MetricTarget{.url = "http://collector:4317"});
  config.log_export_targets.push_back(
      LogTarget{.url = "http://collector:4317", .export_severity = Severity::Warn});

  Otel otel(config, factory);
  otel.registry()->CreateCounter("requests")->Add(5);

  auto logger = observability::GetLogger("otel_test");
  logger->warn("disk almost full");
  logger->info("below target minimum");

  otel.Shutdown();
  otel.Shutdown();

  ASSERT_EQ(factory->metric_recorders.size(), 1u);
  EXPECT_EQ(factory->metric_recorders[0]->calls.load(), 1);
  const auto batches = factory->metric_recorders[0]->Batches();
  ASSERT_EQ(batches.size(), 1u);
  EXPECT_EQ(testing::TotalOf(batches[0], "requests"), 5.0);

  ASSERT_EQ(factory->log_recorders.size(), 1u);
  const auto received = factory->log_recorders[0]->Received();
  const auto has = [&](const std::string& body) {
    return std::any_of(received.begin(), received.end(),
                       [&](const testing::RecordedLog& r) { return r.body == body; });
  };
  EXPECT_TRUE(has("disk almost full"));
  EXPECT_FALSE(has("below target minimum"));

  EXPECT_FALSE(observability::GetLogRouter()->attached());
}

TEST(OtelTest, RunExportsUntilStoppedAndReleasesScrapePort) {
  auto factory = std::make_shared<FakeExporterFactory>();
  Config config = QuietConfig();
  config.prometheus_config = PrometheusConfig{0};

  auto otel = std::make_unique<Otel>(config, factory);
  otel->registry()->CreateCounter("requests")->Add(1);
  const uint16_t port = otel->scrape_port().value();
  EXPECT_NE(otel->RenderScrape().find("requests_total"), std::string::npos);

  StopSource source;
  std::thread runner([&] { otel->Run(source.token()); });

  EXPECT_TRUE(CanConnect(port));

  source.request_stop();
  runner.join();

  EXPECT_NO_THROW(scrape::ScrapeServer(port, [] { return std::string(); }));
  otel.reset();
  EXPECT_FALSE(observability::GetLogRouter()->attached());
}

TEST(OtelTest, BlockedTargetDoesNotDelayAnother) {
  auto factory = std::make_shared<FakeExporterFactory>();
  factory->metric_block_for["http://slow:4317"] = 2500ms;

  Config config = QuietConfig();
  config.metrics_export_targets.push_back(
      MetricTarget{.url = "http://slow:4317", .interval_secs = 1, .timeout = 1});
  config.metrics_export_targets.push_back(
      MetricTarget{.url = "http://fast:4317", .interval_secs = 1, .timeout = 1});

  Otel otel(config, factory);
  otel.registry()->CreateCounter("requests")->Add(1);
  ASSERT_EQ(factory->metric_recorders.size(), 2u);
  auto& slow = factory->metric_recorders[0];
  auto& fast = factory->metric_recorders[1];

  // Three one-second intervals, plus scheduling slack.
  EXPECT_TRUE(fast->WaitForBatches(3, 3s + 750ms));
  EXPECT_LE(slow->Batches().size(), 1u);

  slow->Unblock();
  otel.Shutdown();
}

TEST(OtelTest, SecondRunIsRejected) {
  Otel otel(QuietConfig(), std::make_shared<FakeExporterFactory>());
  StopSource source;
  source.request_stop();

  otel.Run(source.token());
  EXPECT_THROW(otel.Run(source.token()), std::logic_error);
}

TEST(OtelTest, RunRequiresStoppableToken) {
  Otel otel(QuietConfig(), std::make_shared<FakeExporterFactory>());

  EXPECT_THROW(otel.Run(StopToken{}), std::invalid_argument);
}

}  // namespace
}  // namespace otelpipe
