#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "cycle_recorder.hpp"
#include "inference_api.hpp"
#include "metrics.hpp"
#include "session.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop = true; }

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"BinSort inference server: classification and session counters over HTTP"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  int port_override = 0;
  cli_app.add_option("-p,--port", port_override, "Listen port (overrides server.port)");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("BinSort inference server starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Invalid configuration {}: {}", cfg_path, e.what());
    return 1;
  }
  if (port_override > 0) app.server.port = port_override;

  MetricsRegistry metrics;
  CycleRecorder recorder(app.recorder);
  std::unique_ptr<SessionController> controller;
  try {
    controller = build_session_controller(app, createInferenceEngine(app.inference), metrics, &recorder);
  } catch (const std::exception& e) {
    spdlog::error("Startup failed: {}", e.what());
    return 1;
  }
  if (app.session.auto_start) controller->start();

  httplib::Server svr;
  InferenceApi api(*controller, metrics, app.peripheral.id);
  api.bind(svr);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::thread watcher([&svr] {
    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    svr.stop();
  });

  spdlog::info("HTTP server listening on {}:{}", app.server.host, app.server.port);
  if (!svr.listen(app.server.host, app.server.port)) {
    spdlog::error("Cannot listen on {}:{}", app.server.host, app.server.port);
  }

  g_stop = true;
  watcher.join();
  controller->stop();
  recorder.logSummary(true);
  spdlog::info("Shutdown complete.");
  return 0;
}
