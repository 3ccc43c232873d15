#pragma once

#include <opentelemetry/logs/logger.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <spdlog/sinks/base_sink.h>

#include <cstdio>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

#include "otelpipe/config.h"
#include "otelpipe/level_filter.h"
#include "otelpipe/observability/log_record.h"

namespace otelpipe::observability {

// Regex disallow filter with both expressions compiled.
struct CompiledRegexFilter {
  std::regex module;
  std::regex text;
};

// Throws SetupError on an invalid expression.
std::vector<CompiledRegexFilter> CompileRegexFilters(const std::vector<RegexFilter>& filters);

// ------------------------------------------------------------
// LogBridge
// ------------------------------------------------------------
// Receives every record logged through spdlog while attached:
//
// - drops records rejected by the global level filter or matched by a
//   regex disallow filter
// - writes the stderr syslog mirror line (when enabled)
// - emits the record through the OpenTelemetry logger (when there are
//   log targets), whose per-target processors apply each target's own
//   predicate
//
// Emit runs on the logging thread and never logs itself.
//
class LogBridge {
 public:
  struct Options {
    std::string service_name;
    std::string host_name;
    bool emit_to_stderr{true};
    std::FILE* stderr_stream{stderr};
  };

  // `logger` may be null.
  LogBridge(Options options, std::shared_ptr<const LevelFilter> filter,
            std::vector<CompiledRegexFilter> regex_filters,
            opentelemetry::nostd::shared_ptr<opentelemetry::logs::Logger> logger);

  void Emit(const LogRecord& record);

  bool Accepts(const LogRecord& record) const;

  const LevelFilter& filter() const noexcept {
    return *filter_;
  }

 private:
  Options options_;
  std::shared_ptr<const LevelFilter> filter_;
  std::vector<CompiledRegexFilter> regex_filters_;
  opentelemetry::nostd::shared_ptr<opentelemetry::logs::Logger> logger_;
};

// ------------------------------------------------------------
// LogRouterSink
// ------------------------------------------------------------
// The single sink shared by every otelpipe logger. Forwards records to
// the attached LogBridge, or to the local stdout sink when none is.
//
class LogRouterSink final : public spdlog::sinks::base_sink<std::mutex> {
 public:
  explicit LogRouterSink(spdlog::sink_ptr fallback);

  // Replaces the current bridge and widens every logger's level to what
  // the bridge's filter may let through.
  void Attach(std::shared_ptr<LogBridge> bridge);

  // Detaches `bridge` if it is still the attached one and restores the
  // local logging level.
  void Detach(const LogBridge* bridge);

  bool attached();

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override;
  void flush_() override;

 private:
  spdlog::sink_ptr fallback_;
  std::shared_ptr<LogBridge> bridge_;
};

// Process-wide router. The first call also installs the otelpipe logger
// as spdlog's default logger.
std::shared_ptr<LogRouterSink> GetLogRouter();

// Converts a spdlog record. Returns false for level::off.
bool ToLogRecord(const spdlog::details::log_msg& msg, LogRecord& out);

}  // namespace otelpipe::observability
