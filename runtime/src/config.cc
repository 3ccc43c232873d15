#include "otelpipe/config.h"

#include <fmt/format.h>

#include <set>

#include "otelpipe/setup_error.h"

namespace otelpipe {

namespace {

template <typename Target>
void ValidateTarget(const Target& target, const char* kind, std::size_t index) {
  if (target.url.empty()) {
    throw SetupError(fmt::format("{} export target #{} has an empty url", kind, index));
  }
  if (target.interval_secs == 0) {
    throw SetupError(
        fmt::format("{} export target '{}' has interval_secs = 0", kind, target.url));
  }
  if (target.timeout == 0) {
    throw SetupError(fmt::format("{} export target '{}' has timeout = 0", kind, target.url));
  }
  if (target.interval_secs > kMaxTargetSeconds) {
    throw SetupError(fmt::format("{} export target '{}' has interval_secs = {}, above {}", kind,
                                 target.url, target.interval_secs, kMaxTargetSeconds));
  }
  if (target.timeout > kMaxTargetSeconds) {
    throw SetupError(fmt::format("{} export target '{}' has timeout = {}, above {}", kind,
                                 target.url, target.timeout, kMaxTargetSeconds));
  }
}

}  // namespace

void Validate(const Config& config) {
  if (config.service_name.empty()) {
    throw SetupError("service_name must not be empty");
  }

  std::set<std::string> keys;
  for (const auto& attribute : config.resource_attributes) {
    if (attribute.key.empty()) {
      throw SetupError("resource attribute with an empty key");
    }
    if (!keys.insert(attribute.key).second) {
      throw SetupError(fmt::format("duplicate resource attribute key '{}'", attribute.key));
    }
  }

  for (std::size_t i = 0; i < config.metrics_export_targets.size(); ++i) {
    ValidateTarget(config.metrics_export_targets[i], "metrics", i);
  }
  for (std::size_t i = 0; i < config.log_export_targets.size(); ++i) {
    ValidateTarget(config.log_export_targets[i], "logs", i);
  }
}

}  // namespace otelpipe
