#include <iostream>
#include <memory>
#include <string>

#include "otelpipe/config_loader.h"
#include "otelpipe/observability/local_logging.h"
#include "otelpipe/otel.h"
#include "otelpipe/setup_error.h"
#include "otelpipe/signal_handler.h"
#include "otelpipe/stop_token.h"

// ============================================================
// Main
// ============================================================

int main(int argc, char** argv) {
  // ----------------------------------------------------------
  // Argument parsing
  // ----------------------------------------------------------
  //
  // The agent expects exactly one argument:
  //   - an observability config file (YAML or JSON)
  //
  if (argc != 2) {
    std::cerr << "usage: otelpipe_agent <config.yaml|config.json>\n";
    return 1;
  }

  // ----------------------------------------------------------
  // Signals
  // ----------------------------------------------------------
  //
  // Installed before any thread exists so that SIGINT/SIGTERM are
  // delivered only to the signal thread.
  //
  otelpipe::StopSource stop;
  otelpipe::SignalHandler::Install(stop);

  otelpipe::observability::InitLocalLogging(/*debug=*/false);

  // ----------------------------------------------------------
  // Setup
  // ----------------------------------------------------------
  //
  // Any configuration problem (unreadable file, bad level
  // expression, busy scrape port, ...) is reported here and
  // nothing is started.
  //
  std::unique_ptr<otelpipe::Otel> otel;
  try {
    otel = std::make_unique<otelpipe::Otel>(otelpipe::LoadConfigFile(argv[1]));
  } catch (const otelpipe::SetupError& e) {
    std::cerr << "otelpipe setup failed: " << e.what() << "\n";
    return 1;
  }

  // ----------------------------------------------------------
  // Run until SIGINT/SIGTERM, then flush once
  // ----------------------------------------------------------
  otel->Run(stop.token());
  otel->Shutdown();

  return 0;
}
