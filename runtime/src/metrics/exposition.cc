#include "otelpipe/metrics/exposition.h"

#include <fmt/format.h>
#include <opentelemetry/nostd/variant.h>
#include <opentelemetry/sdk/metrics/data/metric_data.h>
#include <opentelemetry/sdk/metrics/data/point_data.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

#include "otelpipe/exporters/otel_conversion.h"

namespace otel_metrics = opentelemetry::sdk::metrics;
namespace nostd = opentelemetry::nostd;

namespace otelpipe::metrics {

namespace {

using SampleLabels = std::map<std::string, std::string>;

std::string Sanitize(std::string_view name, bool allow_colon) {
  std::string out;
  out.reserve(name.size() + 1);
  for (const char c : name) {
    const bool ok =
        std::isalnum(static_cast<unsigned char>(c)) || c == '_' || (allow_colon && c == ':');
    out.push_back(ok ? c : '_');
  }
  if (out.empty() || std::isdigit(static_cast<unsigned char>(out.front()))) {
    out.insert(out.begin(), '_');
  }
  return out;
}

// A label named `reserved` is kept as exported_<reserved>.
SampleLabels MergeLabels(const SampleLabels& base, const Labels& point,
                         std::string_view reserved = {}) {
  SampleLabels merged = base;
  for (const auto& [key, value] : point) {
    merged[SanitizeLabelName(key)] = value;
  }
  if (!reserved.empty()) {
    const std::string name(reserved);
    if (auto it = merged.find(name); it != merged.end()) {
      merged["exported_" + name] = std::move(it->second);
      merged.erase(it);
    }
  }
  return merged;
}

std::string_view FamilyType(otel_metrics::InstrumentType type) {
  switch (type) {
    case otel_metrics::InstrumentType::kCounter:
    case otel_metrics::InstrumentType::kObservableCounter:
      return "counter";
    case otel_metrics::InstrumentType::kHistogram:
      return "histogram";
    default:
      return "gauge";
  }
}

std::string EscapeHelp(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '\\') {
      out += "\\\\";
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

void AppendHeader(std::string& out, std::string_view name, std::string_view help,
                  std::string_view type) {
  if (help.empty()) {
    fmt::format_to(std::back_inserter(out), "# HELP {}\n", name);
  } else {
    fmt::format_to(std::back_inserter(out), "# HELP {} {}\n", name, EscapeHelp(help));
  }
  fmt::format_to(std::back_inserter(out), "# TYPE {} {}\n", name, type);
}

void AppendSample(std::string& out, std::string_view name, const SampleLabels& labels,
                  std::string_view value, const std::string* le = nullptr) {
  out += name;
  if (!labels.empty() || le) {
    out.push_back('{');
    bool first = true;
    for (const auto& [key, label_value] : labels) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      fmt::format_to(std::back_inserter(out), "{}=\"{}\"", key, EscapeLabelValue(label_value));
    }
    if (le) {
      fmt::format_to(std::back_inserter(out), "{}le=\"{}\"", first ? "" : ",", *le);
    }
    out.push_back('}');
  }
  out.push_back(' ');
  out += value;
  out.push_back('\n');
}

// `counts` holds per-bucket counts: counts[i] covers
// (boundaries[i-1], boundaries[i]], the last entry covers
// (boundaries.back(), +Inf).
void AppendHistogram(std::string& out, const std::string& name, const SampleLabels& labels,
                     const otel_metrics::HistogramPointData& data) {
  uint64_t cumulative = 0;
  for (std::size_t i = 0; i < data.boundaries_.size(); ++i) {
    if (i < data.counts_.size()) {
      cumulative += data.counts_[i];
    }
    const std::string le = FormatSampleValue(data.boundaries_[i]);
    AppendSample(out, name + "_bucket", labels, std::to_string(cumulative), &le);
  }

  const std::string inf = "+Inf";
  AppendSample(out, name + "_bucket", labels, std::to_string(data.count_), &inf);
  AppendSample(out, name + "_sum", labels, FormatSampleValue(exporters::ToDouble(data.sum_)));
  AppendSample(out, name + "_count", labels, std::to_string(data.count_));
}

}  // namespace

std::string SanitizeMetricName(std::string_view name) {
  return Sanitize(name, true);
}

std::string SanitizeLabelName(std::string_view name) {
  return Sanitize(name, false);
}

std::string EscapeLabelValue(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string FormatSampleValue(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0 ? "+Inf" : "-Inf";
  }
  return fmt::format("{}", value);
}

std::string RenderExposition(const otel_metrics::ResourceMetrics& data,
                             const Resource& resource) {
  SampleLabels resource_labels;
  for (const auto& [key, value] : resource.attributes()) {
    resource_labels[SanitizeLabelName(key)] = value;
  }

  std::string out;
  AppendHeader(out, "target_info", "Target metadata", "gauge");
  AppendSample(out, "target_info", resource_labels, "1");

  std::vector<const otel_metrics::MetricData*> families;
  for (const auto& scope : data.scope_metric_data_) {
    for (const auto& metric : scope.metric_data_) {
      if (!metric.point_data_attr_.empty()) {
        families.push_back(&metric);
      }
    }
  }
  std::sort(families.begin(), families.end(), [](const auto* a, const auto* b) {
    return a->instrument_descriptor.name_ < b->instrument_descriptor.name_;
  });

  for (const auto* metric : families) {
    const auto& descriptor = metric->instrument_descriptor;
    std::string name = SanitizeMetricName(descriptor.name_);

    const std::string_view type = FamilyType(descriptor.type_);
    if (type == "counter" && !name.ends_with("_total")) {
      name += "_total";
    }
    AppendHeader(out, name, descriptor.description_, type);

    for (const auto& point : metric->point_data_attr_) {
      const Labels point_labels = exporters::ToLabels(point.attributes);

      if (nostd::holds_alternative<otel_metrics::HistogramPointData>(point.point_data)) {
        AppendHistogram(out, name, MergeLabels(resource_labels, point_labels, "le"),
                        nostd::get<otel_metrics::HistogramPointData>(point.point_data));
      } else if (nostd::holds_alternative<otel_metrics::SumPointData>(point.point_data)) {
        const auto& sum = nostd::get<otel_metrics::SumPointData>(point.point_data);
        AppendSample(out, name, MergeLabels(resource_labels, point_labels),
                     FormatSampleValue(exporters::ToDouble(sum.value_)));
      } else if (nostd::holds_alternative<otel_metrics::LastValuePointData>(point.point_data)) {
        const auto& last = nostd::get<otel_metrics::LastValuePointData>(point.point_data);
        AppendSample(out, name, MergeLabels(resource_labels, point_labels),
                     FormatSampleValue(exporters::ToDouble(last.value_)));
      }
    }
  }

  return out;
}

// ------------------------------------------------------------
// ExpositionReader
// ------------------------------------------------------------

ExpositionReader::ExpositionReader(Resource resource) : resource_(std::move(resource)) {}

std::string ExpositionReader::Render() {
  // Rendering may throw; Collect's callback may not, so copy out first.
  otel_metrics::ResourceMetrics snapshot;
  const bool collected = Collect([&snapshot](otel_metrics::ResourceMetrics& data) {
    snapshot = std::move(data);
    return true;
  });
  if (!collected) {
    throw std::runtime_error("metric reader is shut down");
  }
  return RenderExposition(snapshot, resource_);
}

}  // namespace otelpipe::metrics
