#pragma once

#include <string>
#include <string_view>

#include "otelpipe/config.h"
#include "otelpipe/v1/config.pb.h"

namespace otelpipe {

// ------------------------------------------------------------
// Config loading
// ------------------------------------------------------------
// Files follow the otelpipe.v1.ObservabilityConfig schema. YAML is first
// converted to JSON text and then parsed by protobuf's JSON mapping, so
// both formats share one set of field names and validation rules.
//
// Every function throws SetupError; none of them calls Validate().
//

// Dispatches on the extension: .yaml / .yml / .json
Config LoadConfigFile(const std::string& path);

Config ParseConfigYaml(std::string_view yaml);
Config ParseConfigJson(std::string_view json);

// Applies the in-memory defaults for every field the message leaves unset.
Config FromProto(const v1::ObservabilityConfig& proto);

}  // namespace otelpipe
