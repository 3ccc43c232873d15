#include "otelpipe/observability/logging.h"

#include <spdlog/spdlog.h>

#include <mutex>

#include "otelpipe/observability/log_bridge.h"

namespace otelpipe::observability {

namespace {

std::mutex& LoggerCreationMutex() {
  static std::mutex mu;
  return mu;
}

const std::shared_ptr<spdlog::logger>& InternalLogger() {
  static const std::shared_ptr<spdlog::logger> logger = GetLogger(kInternalLoggerName);
  return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> GetLogger(const std::string& module) {
  auto router = GetLogRouter();

  std::lock_guard lock(LoggerCreationMutex());
  if (auto existing = spdlog::get(module)) {
    return existing;
  }

  // initialize_logger applies the registry's current level
  auto logger = std::make_shared<spdlog::logger>(module, std::move(router));
  spdlog::initialize_logger(logger);
  return logger;
}

spdlog::level::level_enum ToSpdlogLevel(Severity severity) noexcept {
  switch (severity) {
    case Severity::Trace:
      return spdlog::level::trace;
    case Severity::Debug:
      return spdlog::level::debug;
    case Severity::Info:
      return spdlog::level::info;
    case Severity::Warn:
      return spdlog::level::warn;
    case Severity::Error:
      return spdlog::level::err;
  }
  return spdlog::level::info;
}

bool IsLogEnabled(Severity level) {
  return InternalLogger()->should_log(ToSpdlogLevel(level));
}

void Log(Severity level, std::string_view message, const char* file, int line) {
  InternalLogger()->log(spdlog::source_loc{file, line, ""}, ToSpdlogLevel(level),
                        spdlog::string_view_t(message.data(), message.size()));
}

}  // namespace otelpipe::observability
