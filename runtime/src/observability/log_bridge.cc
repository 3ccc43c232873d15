#include "otelpipe/observability/log_bridge.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <utility>

#include "otelpipe/exporters/otel_conversion.h"
#include "otelpipe/observability/local_logging.h"
#include "otelpipe/observability/logging.h"
#include "otelpipe/observability/syslog_writer.h"
#include "otelpipe/setup_error.h"

namespace otelpipe::observability {

std::vector<CompiledRegexFilter> CompileRegexFilters(const std::vector<RegexFilter>& filters) {
  std::vector<CompiledRegexFilter> compiled;
  compiled.reserve(filters.size());

  for (const auto& filter : filters) {
    try {
      compiled.push_back(CompiledRegexFilter{std::regex(filter.module_regex),
                                             std::regex(filter.log_text_regex)});
    } catch (const std::regex_error& e) {
      throw SetupError(fmt::format("invalid regex filter (module '{}', text '{}'): {}",
                                   filter.module_regex, filter.log_text_regex, e.what()));
    }
  }
  return compiled;
}

bool ToLogRecord(const spdlog::details::log_msg& msg, LogRecord& out) {
  switch (msg.level) {
    case spdlog::level::trace:
      out.severity = Severity::Trace;
      break;
    case spdlog::level::debug:
      out.severity = Severity::Debug;
      break;
    case spdlog::level::info:
      out.severity = Severity::Info;
      break;
    case spdlog::level::warn:
      out.severity = Severity::Warn;
      break;
    case spdlog::level::err:
    case spdlog::level::critical:
      out.severity = Severity::Error;
      break;
    default:
      return false;
  }

  out.timestamp = msg.time;
  out.module.assign(msg.logger_name.data(), msg.logger_name.size());
  out.body.assign(msg.payload.data(), msg.payload.size());
  out.thread_id = msg.thread_id;
  return true;
}

// ------------------------------------------------------------
// LogBridge
// ------------------------------------------------------------

LogBridge::LogBridge(Options options, std::shared_ptr<const LevelFilter> filter,
                     std::vector<CompiledRegexFilter> regex_filters,
                     opentelemetry::nostd::shared_ptr<opentelemetry::logs::Logger> logger)
    : options_(std::move(options)),
      filter_(std::move(filter)),
      regex_filters_(std::move(regex_filters)),
      logger_(std::move(logger)) {}

bool LogBridge::Accepts(const LogRecord& record) const {
  if (!filter_->Enabled(record.module, record.severity)) {
    return false;
  }

  for (const auto& filter : regex_filters_) {
    if (std::regex_search(record.module, filter.module) &&
        std::regex_search(record.body, filter.text)) {
      return false;
    }
  }
  return true;
}

void LogBridge::Emit(const LogRecord& record) {
  if (!Accepts(record)) {
    return;
  }

  if (options_.emit_to_stderr) {
    fmt::print(options_.stderr_stream, "{}\n",
               FormatSyslogLine(record, options_.service_name, options_.host_name));
  }

  if (logger_) {
    exporters::EmitLogRecord(*logger_, record);
  }
}

// ------------------------------------------------------------
// LogRouterSink
// ------------------------------------------------------------

LogRouterSink::LogRouterSink(spdlog::sink_ptr fallback) : fallback_(std::move(fallback)) {}

void LogRouterSink::Attach(std::shared_ptr<LogBridge> bridge) {
  std::optional<Severity> most_verbose;
  {
    std::lock_guard lock(mutex_);
    most_verbose = bridge->filter().MostVerbose();
    bridge_ = std::move(bridge);
  }

  spdlog::set_level(most_verbose ? ToSpdlogLevel(*most_verbose) : spdlog::level::off);
}

void LogRouterSink::Detach(const LogBridge* bridge) {
  {
    std::lock_guard lock(mutex_);
    if (bridge_.get() != bridge) {
      return;
    }
    bridge_.reset();
  }

  spdlog::set_level(spdlog::level::info);
}

bool LogRouterSink::attached() {
  std::lock_guard lock(mutex_);
  return bridge_ != nullptr;
}

void LogRouterSink::sink_it_(const spdlog::details::log_msg& msg) {
  if (!bridge_) {
    fallback_->log(msg);
    return;
  }

  LogRecord record;
  if (ToLogRecord(msg, record)) {
    bridge_->Emit(record);
  }
}

void LogRouterSink::flush_() {
  fallback_->flush();
}

std::shared_ptr<LogRouterSink> GetLogRouter() {
  static const std::shared_ptr<LogRouterSink> router = [] {
    auto sink = std::make_shared<LogRouterSink>(MakeLocalSink());

    auto logger = std::make_shared<spdlog::logger>(kInternalLoggerName, sink);
    spdlog::drop(kInternalLoggerName);
    spdlog::initialize_logger(logger);
    spdlog::set_default_logger(logger);
    return sink;
  }();
  return router;
}

}  // namespace otelpipe::observability
