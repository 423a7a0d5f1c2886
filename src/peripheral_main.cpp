#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <string>
#include <thread>

#include "actuator.hpp"
#include "capture_source.hpp"
#include "peripheral_service.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop = true; }

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"BinSort peripheral: camera capture and motor channels over HTTP"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

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
  applyLogLevel(app.recorder.log_level);

  std::unique_ptr<PeripheralService> service;
  try {
    auto camera = std::make_unique<LocalCameraSource>(app.camera, app.peripheral.id);
    auto actuator = std::make_unique<LocalActuator>(
        app.actuator, std::make_unique<SysfsGpioOutput>(app.actuator.gpio_root));
    service = std::make_unique<PeripheralService>(std::move(camera), std::move(actuator));
  } catch (const std::exception& e) {
    spdlog::error("Startup failed: {}", e.what());
    return 1;
  }

  std::string candidates;
  for (const auto& d : app.camera.devices) candidates += (candidates.empty() ? "" : ", ") + d;
  spdlog::info("Camera candidates: {}", candidates);
  spdlog::info("Motors: can=pin{} ({}ms), plastic=pin{} ({}ms)", app.actuator.can.pin,
               app.actuator.can.duration_ms, app.actuator.plastic.pin,
               app.actuator.plastic.duration_ms);

  httplib::Server svr;
  service->bind(svr);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::thread watcher([&svr] {
    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    svr.stop();
  });

  const auto& listen = app.peripheral_service;
  spdlog::info("Peripheral server listening on {}:{}", listen.host, listen.port);
  if (!svr.listen(listen.host, listen.port)) {
    spdlog::error("Cannot listen on {}:{}", listen.host, listen.port);
  }

  g_stop = true;
  watcher.join();
  // Camera released here; the actuator drives both channels low as it is destroyed.
  service.reset();
  spdlog::info("Shutdown complete.");
  return 0;
}
