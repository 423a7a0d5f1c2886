#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "cycle_recorder.hpp"
#include "metrics.hpp"
#include "session.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_stop{false};

// Only observed between cycles, so a motor run in progress always completes.
void on_signal(int) { g_stop = true; }

void print_result(const CycleResult& r) {
  if (r.ok()) {
    std::cout << fmt::format("[OK] {} ({:.2f}%) -> can={} plastic={} ({:.0f} ms)",
                             label_name(r.classification->label),
                             round_confidence(r.classification->confidence), r.counts.can,
                             r.counts.plastic, r.timings.e2e_ms)
              << std::endl;
  } else {
    std::cout << fmt::format("[FAILED] {} at {}: {}", error_kind_name(*r.error),
                             r.peripheral_id, r.message)
              << std::endl;
  }
}

void run_connectivity_check(const PeerConfig& peer) {
  PeerClient client(peer);
  std::cout << "Checking peripheral '" << peer.id << "' at " << client.base_url() << std::endl;
  try {
    PeerResponse status = client.get("/api/status");
    raise_for_peer_error(status, ErrorKind::ProtocolError);
    PeripheralStatus s = parse_peripheral_status(status.body);
    std::cout << fmt::format("  status: online, camera_available={}, gpio_initialized={}",
                             s.camera_available, s.actuator_ready)
              << std::endl;

    PeerResponse test = client.get("/api/test");
    raise_for_peer_error(test, ErrorKind::CaptureUnavailable);
    std::cout << "  self-test: " << test.body.value("message", std::string{"ok"})
              << ", camera_shape=" << test.body.value("camera_shape", nlohmann::json::array()).dump()
              << std::endl;
  } catch (const StageError& e) {
    std::cout << fmt::format("  [FAILED] {}: {}", error_kind_name(e.kind()), e.what()) << std::endl;
  } catch (const nlohmann::json::exception& e) {
    std::cout << fmt::format("  [FAILED] ProtocolError: {}", e.what()) << std::endl;
  }
}

// Sleeps up to `interval`, returning early once a stop was requested.
void wait_interval(std::chrono::milliseconds interval) {
  const auto until = std::chrono::steady_clock::now() + interval;
  while (!g_stop && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"BinSort: capture, classify and sort items through a peripheral node"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);
  cli_app.require_subcommand(1);

  auto* test_cmd = cli_app.add_subcommand("test", "Check connectivity to the peripheral only");
  auto* once_cmd = cli_app.add_subcommand("once", "Run a single capture/classify/sort cycle");
  auto* cont_cmd = cli_app.add_subcommand("continuous", "Run cycles until interrupted");
  double interval_s = 5.0;
  cont_cmd->add_option("interval_seconds", interval_s, "Pause between cycles")
      ->required()
      ->check(CLI::PositiveNumber);

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Invalid configuration {}: {}", cfg_path, e.what());
    return 1;
  }

  if (test_cmd->parsed()) {
    run_connectivity_check(app.peripheral);
    return 0;
  }

  MetricsRegistry metrics;
  CycleRecorder recorder(app.recorder);
  std::unique_ptr<SessionController> controller;
  try {
    controller = build_session_controller(app, createInferenceEngine(app.inference), metrics, &recorder);
  } catch (const std::exception& e) {
    spdlog::error("Startup failed: {}", e.what());
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  controller->start();

  if (once_cmd->parsed()) {
    print_result(controller->run_cycle(app.peripheral.id));
  } else {
    const auto interval = std::chrono::milliseconds(static_cast<long long>(interval_s * 1000.0));
    std::cout << fmt::format("Running every {:.1f}s, Ctrl+C to stop", interval_s) << std::endl;
    while (!g_stop) {
      print_result(controller->run_cycle(app.peripheral.id));
      wait_interval(interval);
    }
  }

  SessionSnapshot final_state = controller->stop();
  std::cout << fmt::format("Session {}: can={} plastic={} total={}", final_state.id,
                           final_state.counts.can, final_state.counts.plastic,
                           final_state.counts.total())
            << std::endl;
  recorder.logSummary(true);
  return 0;
}
