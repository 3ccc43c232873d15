#pragma once

#include <fmt/core.h>
#include <spdlog/logger.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "otelpipe/severity.h"

namespace otelpipe::observability {

// Logger used by the library itself. It is also installed as spdlog's
// default logger, so plain spdlog::info(...) calls carry this module.
inline constexpr const char* kInternalLoggerName = "otelpipe";

// ------------------------------------------------------------
// Named loggers
//
// Every logger returned here writes to the process-wide router sink, so
// records reach the stderr mirror and the log pipelines once an Otel
// instance is attached, and the local colored stdout sink otherwise.
// The logger name is the record's module.
// ------------------------------------------------------------
std::shared_ptr<spdlog::logger> GetLogger(const std::string& module);

spdlog::level::level_enum ToSpdlogLevel(Severity severity) noexcept;

void Log(Severity level, std::string_view message, const char* file, int line);

// ------------------------------------------------------------
// Lazy formatting helper
// ------------------------------------------------------------
bool IsLogEnabled(Severity level);

template <typename... Args>
inline void LogFmt(Severity level, const char* file, int line, fmt::format_string<Args...> fmt_str,
                   Args&&... args) {
  if (!IsLogEnabled(level))
    return;

  Log(level, fmt::format(fmt_str, std::forward<Args>(args)...), file, line);
}

}  // namespace otelpipe::observability

// ============================================================
// fmt logging macros
// ============================================================

#define OP_LOG_DEBUG_FMT(fmt, ...) \
  ::otelpipe::observability::LogFmt(::otelpipe::Severity::Debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define OP_LOG_INFO_FMT(fmt, ...) \
  ::otelpipe::observability::LogFmt(::otelpipe::Severity::Info, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define OP_LOG_WARN_FMT(fmt, ...) \
  ::otelpipe::observability::LogFmt(::otelpipe::Severity::Warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define OP_LOG_ERROR_FMT(fmt, ...) \
  ::otelpipe::observability::LogFmt(::otelpipe::Severity::Error, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
