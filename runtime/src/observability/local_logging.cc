#include "otelpipe/observability/local_logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "otelpipe/observability/log_bridge.h"

namespace otelpipe::observability {

spdlog::sink_ptr MakeLocalSink() {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

  // Timestamp + level + module + message
  sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  return sink;
}

void InitLocalLogging(bool debug) {
  // Creates the router and the default logger on first use
  GetLogRouter();

  spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);

  // Never throw from logging
  spdlog::set_error_handler([](const std::string&) {});
}

}  // namespace otelpipe::observability
