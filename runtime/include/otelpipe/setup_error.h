#pragma once

#include <stdexcept>
#include <string>

namespace otelpipe {

// Thrown while building an Otel instance or loading its configuration.
// Nothing has been started when this escapes.
class SetupError : public std::runtime_error {
 public:
  explicit SetupError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace otelpipe
