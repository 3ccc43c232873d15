#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "otelpipe/severity.h"

namespace otelpipe::observability {

// One spdlog record as seen by the log bridge.
struct LogRecord {
  std::chrono::system_clock::time_point timestamp;
  Severity severity{Severity::Info};
  std::string module;  // spdlog logger name
  std::string body;
  uint64_t thread_id = 0;
};

}  // namespace otelpipe::observability
