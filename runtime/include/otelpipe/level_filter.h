#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "otelpipe/severity.h"

namespace otelpipe {

// ------------------------------------------------------------
// LevelFilter
// ------------------------------------------------------------
// Parsed form of a level expression such as "info,hyper=off".
//
// Grammar (comma separated directives):
//   <level>            default severity for every module
//   <module>=<level>   override for modules starting with <module>
//   <module>           same as <module>=trace
//
// <level> is off|error|warn|info|debug|trace (case-insensitive).
// The longest matching module prefix wins. A module matched by no
// directive is disabled. An empty expression means "error".
//
class LevelFilter {
 public:
  // Throws SetupError on a malformed expression.
  static LevelFilter Parse(std::string_view expression);

  bool Enabled(std::string_view module, Severity severity) const noexcept;

  // Most verbose severity any directive lets through, or nullopt when
  // everything is off. Used as the spdlog fast-path level.
  std::optional<Severity> MostVerbose() const noexcept;

 private:
  struct Directive {
    std::string module;              // empty = default
    std::optional<Severity> level;   // nullopt = off
  };

  explicit LevelFilter(std::vector<Directive> directives);

  std::vector<Directive> directives_;  // sorted by module length
};

}  // namespace otelpipe
