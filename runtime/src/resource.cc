#include "otelpipe/resource.h"

#include <utility>

namespace otelpipe {

Resource::Resource(std::string service_name, std::optional<std::string> enterprise_number,
                   std::vector<Attribute> attributes)
    : service_name_(std::move(service_name)), enterprise_number_(std::move(enterprise_number)) {
  for (auto& attribute : attributes) {
    attributes_.insert_or_assign(std::move(attribute.key), std::move(attribute.value));
  }
  if (enterprise_number_) {
    attributes_[kEnterpriseNumberKey] = *enterprise_number_;
  }
  attributes_[kServiceNameKey] = service_name_;
}

Resource Resource::FromConfig(const Config& config) {
  return Resource(config.service_name, config.enterprise_number, config.resource_attributes);
}

}  // namespace otelpipe
