#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "otelpipe/severity.h"

namespace otelpipe {

enum class Temporality { Cumulative, Delta };

// A metrics push target.
struct MetricTarget {
  std::string url;
  uint64_t interval_secs{60};
  uint64_t timeout{30};                     // seconds; expected <= interval_secs
  std::optional<Temporality> temporality;   // Cumulative when unset
  std::optional<std::string> ca_cert_path;  // only used for https:// and grpcs://
};

// A logs push target.
struct LogTarget {
  std::string url;
  uint64_t interval_secs{1};
  uint64_t timeout{30};
  std::optional<Severity> export_severity;  // minimum severity; unset = global filter only
  std::optional<std::string> ca_cert_path;
};

struct Attribute {
  std::string key;
  std::string value;
};

struct PrometheusConfig {
  uint16_t port{9600};  // 0 binds an ephemeral port
};

enum class FilterAction { Disallow };

// Drops log records whose module matches `module_regex` and whose text
// matches `log_text_regex`.
struct RegexFilter {
  std::string module_regex;
  std::string log_text_regex;
  FilterAction action{FilterAction::Disallow};
};

// Process-wide observability configuration. Read once by Otel and never
// mutated afterwards.
struct Config {
  std::string service_name{"App"};
  std::optional<std::string> enterprise_number;

  std::vector<Attribute> resource_attributes;
  std::optional<PrometheusConfig> prometheus_config;

  std::vector<MetricTarget> metrics_export_targets;
  std::vector<LogTarget> log_export_targets;

  bool emit_metrics_to_stdout{false};
  bool emit_logs_to_stderr{true};

  // Logging directives, controllable per module, e.g. "info,grpc=off"
  std::string level{"info"};

  std::vector<RegexFilter> regex_filters;
};

// Upper bound of a target's interval_secs and timeout (one day).
inline constexpr uint64_t kMaxTargetSeconds = 24 * 60 * 60;

// Throws SetupError if `config` cannot be started: empty service name,
// zero interval/timeout or one above kMaxTargetSeconds, or duplicate
// resource attribute keys.
void Validate(const Config& config);

}  // namespace otelpipe
