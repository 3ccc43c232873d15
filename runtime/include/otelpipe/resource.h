#pragma once

#include <optional>
#include <string>
#include <vector>

#include "otelpipe/config.h"
#include "otelpipe/metrics/instruments.h"

namespace otelpipe {

inline constexpr const char* kServiceNameKey = "service.name";
inline constexpr const char* kEnterpriseNumberKey = "enterprise.number";

// Provenance attached to every exported metric and log batch.
// Immutable after construction.
class Resource {
 public:
  Resource(std::string service_name, std::optional<std::string> enterprise_number,
           std::vector<Attribute> attributes);

  static Resource FromConfig(const Config& config);

  const std::string& service_name() const noexcept {
    return service_name_;
  }

  const std::optional<std::string>& enterprise_number() const noexcept {
    return enterprise_number_;
  }

  // service.name, enterprise.number (when set) and the configured
  // attributes. A configured attribute never overrides service.name.
  const metrics::Labels& attributes() const noexcept {
    return attributes_;
  }

 private:
  std::string service_name_;
  std::optional<std::string> enterprise_number_;
  metrics::Labels attributes_;
};

}  // namespace otelpipe
