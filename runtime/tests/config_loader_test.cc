#include "otelpipe/config_loader.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "otelpipe/setup_error.h"

namespace otelpipe {
namespace {

TEST(ConfigLoaderTest, EmptyYamlGivesDefaults) {
  const Config config = ParseConfigYaml("");

  EXPECT_EQ(config.service_name, "App");
  EXPECT_EQ(config.level, "info");
  EXPECT_TRUE(config.emit_logs_to_stderr);
  EXPECT_TRUE(config.metrics_export_targets.empty());
}

TEST(ConfigLoaderTest, ParsesFullYamlDocument) {
  const Config config = ParseConfigYaml(R"(
service_name: checkout
enterprise_number: "4242"
resource_attributes:
  - key: region
    value: eu-west-1
prometheus_config:
  port: 9700
metrics_export_targets:
  - url: https://collector:4317
    interval_secs: 10
    timeout: 5
    temporality: TEMPORALITY_DELTA
    ca_cert_path: /etc/ssl/collector.pem
log_export_targets:
  - url: http://collector:4317
    export_severity: SEVERITY_ERROR
emit_metrics_to_stdout: true
emit_logs_to_stderr: false
level: "info,grpc=off"
regex_filters:
  - module_regex: "^grpc"
    log_text_regex: "connection reset"
    action: FILTER_ACTION_DISALLOW
)");

  EXPECT_EQ(config.service_name, "checkout");
  ASSERT_TRUE(config.enterprise_number.has_value());
  EXPECT_EQ(*config.enterprise_number, "4242");

  ASSERT_EQ(config.resource_attributes.size(), 1u);
  EXPECT_EQ(config.resource_attributes[0].key, "region");
  EXPECT_EQ(config.resource_attributes[0].value, "eu-west-1");

  ASSERT_TRUE(config.prometheus_config.has_value());
  EXPECT_EQ(config.prometheus_config->port, 9700);

  ASSERT_EQ(config.metrics_export_targets.size(), 1u);
  const auto& metrics = config.metrics_export_targets[0];
  EXPECT_EQ(metrics.url, "https://collector:4317");
  EXPECT_EQ(metrics.interval_secs, 10u);
  EXPECT_EQ(metrics.timeout, 5u);
  EXPECT_EQ(metrics.temporality, Temporality::Delta);
  EXPECT_EQ(metrics.ca_cert_path, "/etc/ssl/collector.pem");

  ASSERT_EQ(config.log_export_targets.size(), 1u);
  const auto& logs = config.log_export_targets[0];
  EXPECT_EQ(logs.interval_secs, 1u);
  EXPECT_EQ(logs.timeout, 30u);
  EXPECT_EQ(logs.export_severity, Severity::Error);
  EXPECT_FALSE(logs.ca_cert_path.has_value());

  EXPECT_TRUE(config.emit_metrics_to_stdout);
  EXPECT_FALSE(config.emit_logs_to_stderr);
  EXPECT_EQ(config.level, "info,grpc=off");

  ASSERT_EQ(config.regex_filters.size(), 1u);
  EXPECT_EQ(config.regex_filters[0].module_regex, "^grpc");
  EXPECT_EQ(config.regex_filters[0].log_text_regex, "connection reset");
}

TEST(ConfigLoaderTest, TargetDefaultsApply) {
  const Config config = ParseConfigJson(R"({
    "metrics_export_targets": [{"url": "http://collector:4317"}],
    "prometheus_config": {}
  })");

  ASSERT_EQ(config.metrics_export_targets.size(), 1u);
  EXPECT_EQ(config.metrics_export_targets[0].interval_secs, 60u);
  EXPECT_EQ(config.metrics_export_targets[0].timeout, 30u);
  EXPECT_FALSE(config.metrics_export_targets[0].temporality.has_value());

  ASSERT_TRUE(config.prometheus_config.has_value());
  EXPECT_EQ(config.prometheus_config->port, 9600);
}

TEST(ConfigLoaderTest, ExplicitZeroIntervalReachesValidate) {
  const Config config = ParseConfigYaml(R"(
metrics_export_targets:
  - url: http://collector:4317
    interval_secs: 0
)");

  ASSERT_EQ(config.metrics_export_targets.size(), 1u);
  EXPECT_EQ(config.metrics_export_targets[0].interval_secs, 0u);
  EXPECT_THROW(Validate(config), SetupError);
}

TEST(ConfigLoaderTest, UnknownFieldThrows) {
  EXPECT_THROW(ParseConfigJson(R"({"service_name": "a", "bogus": 1})"), SetupError);
  EXPECT_THROW(ParseConfigYaml("bogus: 1\n"), SetupError);
}

TEST(ConfigLoaderTest, MalformedInputThrows) {
  EXPECT_THROW(ParseConfigJson("{not json"), SetupError);
  EXPECT_THROW(ParseConfigYaml("key: [unterminated"), SetupError);
  EXPECT_THROW(ParseConfigYaml("- just\n- a list\n"), SetupError);
}

TEST(ConfigLoaderTest, PortOutOfRangeThrows) {
  EXPECT_THROW(ParseConfigJson(R"({"prometheus_config": {"port": 70000}})"), SetupError);
}

TEST(ConfigLoaderTest, LoadConfigFileDispatchesOnExtension) {
  const std::string path = ::testing::TempDir() + "otelpipe_config_loader_test.yaml";
  {
    std::ofstream out(path);
    out << "service_name: from-file\n";
  }

  EXPECT_EQ(LoadConfigFile(path).service_name, "from-file");
  std::remove(path.c_str());

  EXPECT_THROW(LoadConfigFile("config.toml"), SetupError);
  EXPECT_THROW(LoadConfigFile("/nonexistent/otelpipe.yaml"), SetupError);
}

}  // namespace
}  // namespace otelpipe
