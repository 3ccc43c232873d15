#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>

#include "otelpipe/config.h"
#include "otelpipe/observability/local_logging.h"
#include "otelpipe/observability/logging.h"
#include "otelpipe/otel.h"
#include "otelpipe/setup_error.h"
#include "otelpipe/stop_token.h"

// ============================================================
// Instrumented application example
//
// Records a handful of instruments in a loop while an Otel instance
// mirrors metrics to stdout and, when -o is given, pushes metrics and
// Error logs to an OTLP collector.
//
//   instrumented_app [-n iterations] [-o http://collector:4317]
// ============================================================

namespace {

struct Args {
  uint64_t iterations = 1000;
  std::string collector_url;
};

bool ParseArgs(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      return false;
    }
    if (flag == "-n") {
      args.iterations = std::strtoull(argv[++i], nullptr, 10);
    } else if (flag == "-o") {
      args.collector_url = argv[++i];
    } else {
      return false;
    }
  }
  return true;
}

otelpipe::Config MakeConfig(const Args& args) {
  otelpipe::Config config;
  config.service_name = "instrumented-app";
  config.emit_metrics_to_stdout = true;
  config.level = "info,grpc=off";
  config.resource_attributes = {{"resource_key1", "1"}};

  if (!args.collector_url.empty()) {
    config.metrics_export_targets.push_back(otelpipe::MetricTarget{
        .url = args.collector_url,
        .interval_secs = 1,
        .timeout = 5,
        .temporality = otelpipe::Temporality::Cumulative,
    });
    config.log_export_targets.push_back(otelpipe::LogTarget{
        .url = args.collector_url,
        .interval_secs = 1,
        .timeout = 5,
        .export_severity = otelpipe::Severity::Error,
    });
  }
  return config;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, args)) {
    std::cerr << "usage: instrumented_app [-n iterations] [-o collector_url]\n";
    return 1;
  }

  otelpipe::observability::InitLocalLogging(/*debug=*/false);

  std::unique_ptr<otelpipe::Otel> otel;
  try {
    otel = std::make_unique<otelpipe::Otel>(MakeConfig(args));
  } catch (const otelpipe::SetupError& e) {
    std::cerr << "otel setup failed: " << e.what() << "\n";
    return 1;
  }

  // ----------------------------------------------------------
  // Instruments
  // ----------------------------------------------------------
  auto& registry = *otel->registry();
  auto requests = registry.CreateCounter("requests", "Requests handled");
  auto request_sizes = registry.CreateHistogram("requestsizes", "Request sizes", "By");
  auto request_sizes_f64 = registry.CreateHistogram("requestsizes.f64", "Random request sizes");
  auto connection_errors = registry.CreateCounter("connectionerrors", "Connection errors");
  auto updown = registry.CreateUpDownCounter("updown_counter", "Random walk");

  std::atomic<uint64_t> iteration{0};
  registry.CreateObservableGauge(
      "observable_gauge",
      [&iteration](otelpipe::metrics::ObserverResult& result) {
        result.Observe(static_cast<double>(iteration.load()));
      },
      "Current iteration");

  otelpipe::StopSource stop;
  std::thread otel_thread([&] { otel->Run(stop.token()); });

  spdlog::error("Test error log. Only this log will be exported to the target");

  auto app_log = otelpipe::observability::GetLogger("instrumented_app");
  std::mt19937_64 rng{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, 1'000'000.0);

  for (uint64_t i = 1; i < args.iterations; ++i) {
    requests->Add(1);
    request_sizes->Record(25);
    const double value = dist(rng);
    request_sizes_f64->Record(value);
    connection_errors->Add(1, {{"kind", "refused"}});
    updown->Add((rng() & 1) ? value : -value);
    iteration = i;

    app_log->info("iteration: {}", i);
    std::this_thread::sleep_for(std::chrono::microseconds(100));
  }

  stop.request_stop();
  otel_thread.join();
  otel->Shutdown();
  return 0;
}
