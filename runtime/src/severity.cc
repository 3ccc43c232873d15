#include "otelpipe/severity.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace otelpipe {

std::string_view ToString(Severity severity) noexcept {
  switch (severity) {
    case Severity::Trace:
      return "trace";
    case Severity::Debug:
      return "debug";
    case Severity::Info:
      return "info";
    case Severity::Warn:
      return "warn";
    case Severity::Error:
      return "error";
  }
  return "unknown";
}

std::optional<Severity> ParseSeverity(std::string_view text) noexcept {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace")
    return Severity::Trace;
  if (lower == "debug")
    return Severity::Debug;
  if (lower == "info")
    return Severity::Info;
  if (lower == "warn" || lower == "warning")
    return Severity::Warn;
  if (lower == "error")
    return Severity::Error;
  return std::nullopt;
}

int ToSyslogPriority(Severity severity) noexcept {
  switch (severity) {
    case Severity::Error:
      return 3;
    case Severity::Warn:
      return 4;
    case Severity::Info:
      return 6;
    case Severity::Debug:
    case Severity::Trace:
      return 7;
  }
  return 7;
}

}  // namespace otelpipe
