#pragma once

#include <optional>
#include <string_view>

namespace otelpipe {

// Totally ordered log severity. Higher is more severe.
enum class Severity { Trace = 0, Debug, Info, Warn, Error };

// Lowercase name ("trace" .. "error").
std::string_view ToString(Severity severity) noexcept;

// Case-insensitive parse of "trace|debug|info|warn|warning|error".
std::optional<Severity> ParseSeverity(std::string_view text) noexcept;

// Syslog priority used by the stderr mirror: Error=3, Warn=4, Info=6,
// Debug/Trace=7.
int ToSyslogPriority(Severity severity) noexcept;

}  // namespace otelpipe
