#pragma once

#include <spdlog/common.h>

namespace otelpipe::observability {

// Colored stdout sink used while no Otel instance is attached.
spdlog::sink_ptr MakeLocalSink();

// Installs the router as spdlog's default logger and sets the local
// verbosity. Safe to call more than once.
void InitLocalLogging(bool debug);

}  // namespace otelpipe::observability
