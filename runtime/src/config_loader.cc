#include "otelpipe/config_loader.h"

#include <fmt/format.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>
#include <sstream>

#include "otelpipe/setup_error.h"
#include "otelpipe/util/yaml_to_json.h"

namespace otelpipe {

namespace {

std::optional<Temporality> ToTemporality(v1::Temporality temporality) {
  switch (temporality) {
    case v1::TEMPORALITY_CUMULATIVE:
      return Temporality::Cumulative;
    case v1::TEMPORALITY_DELTA:
      return Temporality::Delta;
    default:
      return std::nullopt;
  }
}

std::optional<Severity> ToSeverity(v1::Severity severity) {
  switch (severity) {
    case v1::SEVERITY_TRACE:
      return Severity::Trace;
    case v1::SEVERITY_DEBUG:
      return Severity::Debug;
    case v1::SEVERITY_INFO:
      return Severity::Info;
    case v1::SEVERITY_WARN:
      return Severity::Warn;
    case v1::SEVERITY_ERROR:
      return Severity::Error;
    default:
      return std::nullopt;
  }
}

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw SetupError(fmt::format("failed to open config file: {}", path));
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

Config FromProto(const v1::ObservabilityConfig& proto) {
  Config config;

  if (!proto.service_name().empty()) {
    config.service_name = proto.service_name();
  }
  if (proto.has_enterprise_number()) {
    config.enterprise_number = proto.enterprise_number();
  }

  for (const auto& attribute : proto.resource_attributes()) {
    config.resource_attributes.push_back(Attribute{attribute.key(), attribute.value()});
  }

  if (proto.has_prometheus_config()) {
    PrometheusConfig prometheus;
    if (proto.prometheus_config().has_port()) {
      const uint32_t port = proto.prometheus_config().port();
      if (port > 65535) {
        throw SetupError(fmt::format("prometheus_config.port {} is out of range", port));
      }
      prometheus.port = static_cast<uint16_t>(port);
    }
    config.prometheus_config = prometheus;
  }

  for (const auto& target : proto.metrics_export_targets()) {
    MetricTarget out;
    out.url = target.url();
    if (target.has_interval_secs())
      out.interval_secs = target.interval_secs();
    if (target.has_timeout())
      out.timeout = target.timeout();
    out.temporality = ToTemporality(target.temporality());
    out.ca_cert_path = NonEmpty(target.ca_cert_path());
    config.metrics_export_targets.push_back(std::move(out));
  }

  for (const auto& target : proto.log_export_targets()) {
    LogTarget out;
    out.url = target.url();
    if (target.has_interval_secs())
      out.interval_secs = target.interval_secs();
    if (target.has_timeout())
      out.timeout = target.timeout();
    out.export_severity = ToSeverity(target.export_severity());
    out.ca_cert_path = NonEmpty(target.ca_cert_path());
    config.log_export_targets.push_back(std::move(out));
  }

  config.emit_metrics_to_stdout = proto.emit_metrics_to_stdout();
  if (proto.has_emit_logs_to_stderr()) {
    config.emit_logs_to_stderr = proto.emit_logs_to_stderr();
  }

  if (!proto.level().empty()) {
    config.level = proto.level();
  }

  for (const auto& filter : proto.regex_filters()) {
    config.regex_filters.push_back(
        RegexFilter{filter.module_regex(), filter.log_text_regex(), FilterAction::Disallow});
  }

  return config;
}

Config ParseConfigJson(std::string_view json) {
  v1::ObservabilityConfig proto;

  google::protobuf::util::JsonParseOptions opts;
  opts.ignore_unknown_fields = false;

  const auto status = google::protobuf::util::JsonStringToMessage(
      google::protobuf::StringPiece(json.data(), json.size()), &proto, opts);
  if (!status.ok()) {
    throw SetupError(fmt::format("config parse failed: {}", status.ToString()));
  }

  return FromProto(proto);
}

Config ParseConfigYaml(std::string_view yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception& e) {
    throw SetupError(fmt::format("yaml parse error: {}", e.what()));
  }

  // An empty document means "all defaults"
  if (!root.IsDefined() || root.IsNull()) {
    return Config{};
  }
  if (!root.IsMap()) {
    throw SetupError("config root must be a mapping");
  }

  std::stringstream json;
  util::yaml_to_json(root, json);
  return ParseConfigJson(json.str());
}

Config LoadConfigFile(const std::string& path) {
  if (path.ends_with(".yaml") || path.ends_with(".yml")) {
    return ParseConfigYaml(ReadFile(path));
  }
  if (path.ends_with(".json")) {
    return ParseConfigJson(ReadFile(path));
  }
  throw SetupError(fmt::format("unsupported config file type (use .yaml or .json): {}", path));
}

}  // namespace otelpipe
