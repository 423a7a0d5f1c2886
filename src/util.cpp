#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

void load_channel(const YAML::Node& n, ChannelConfig& ch) {
  if (!n) return;
  if (n["pin"]) ch.pin = n["pin"].as<int>();
  if (n["duration_ms"]) ch.duration_ms = n["duration_ms"].as<int>();
}

void load_listen(const YAML::Node& n, ListenConfig& l) {
  if (!n) return;
  if (n["host"]) l.host = n["host"].as<std::string>();
  if (n["port"]) l.port = n["port"].as<int>();
}

}  // namespace

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["peripheral"]) {
    auto p = y["peripheral"];
    if (p["id"]) c.peripheral.id = p["id"].as<std::string>();
    if (p["host"]) c.peripheral.host = p["host"].as<std::string>();
    if (p["port"]) c.peripheral.port = p["port"].as<int>();
    if (p["connect_timeout_ms"]) c.peripheral.connect_timeout_ms = p["connect_timeout_ms"].as<int>();
    if (p["request_timeout_ms"]) c.peripheral.request_timeout_ms = p["request_timeout_ms"].as<int>();
  }
  if (y["camera"]) {
    auto cam = y["camera"];
    if (cam["devices"]) {
      c.camera.devices.clear();
      for (const auto& d : cam["devices"]) c.camera.devices.push_back(d.as<std::string>());
    }
    if (cam["width"]) c.camera.width = cam["width"].as<int>();
    if (cam["height"]) c.camera.height = cam["height"].as<int>();
    if (cam["jpeg_quality"]) c.camera.jpeg_quality = cam["jpeg_quality"].as<int>();
  }
  if (y["actuator"]) {
    auto a = y["actuator"];
    if (a["gpio_root"]) c.actuator.gpio_root = a["gpio_root"].as<std::string>();
    if (a["channels"]) {
      load_channel(a["channels"]["can"], c.actuator.can);
      load_channel(a["channels"]["plastic"], c.actuator.plastic);
    }
  }
  if (y["inference"]) {
    auto inf = y["inference"];
    if (inf["model_path"]) c.inference.model_path = inf["model_path"].as<std::string>();
    if (inf["input_width"] && inf["input_height"]) {
      c.inference.input_size = cv::Size(inf["input_width"].as<int>(), inf["input_height"].as<int>());
    }
    if (inf["input_layout"]) c.inference.input_layout = inf["input_layout"].as<std::string>();
  }
  if (y["session"]) {
    auto s = y["session"];
    if (s["capture"]) c.session.capture_mode = s["capture"].as<std::string>();
    if (s["actuator"]) c.session.actuator_mode = s["actuator"].as<std::string>();
    if (s["auto_start"]) c.session.auto_start = s["auto_start"].as<bool>();
  }
  load_listen(y["server"], c.server);
  load_listen(y["peripheral_service"], c.peripheral_service);

  if (y["logging"]) {
    auto l = y["logging"];
    if (l["level"]) c.recorder.log_level = l["level"].as<std::string>();
    if (l["verbose"]) c.recorder.verbose_logging = l["verbose"].as<bool>();
    if (l["summary_interval"]) c.recorder.summary_interval = l["summary_interval"].as<int>();
    if (l["cycle_log_path"]) c.recorder.csv_output_path = l["cycle_log_path"].as<std::string>();
  }

  validate_config(c);
  return c;
}

void validate_config(const AppConfig& c) {
  auto mode_ok = [](const std::string& m) { return m == "local" || m == "remote"; };
  if (!mode_ok(c.session.capture_mode)) {
    throw std::runtime_error("session.capture must be 'local' or 'remote', got '" +
                             c.session.capture_mode + "'");
  }
  if (!mode_ok(c.session.actuator_mode)) {
    throw std::runtime_error("session.actuator must be 'local' or 'remote', got '" +
                             c.session.actuator_mode + "'");
  }
  if (c.camera.devices.empty()) {
    throw std::runtime_error("camera.devices must not be empty");
  }
  for (const auto& d : c.camera.devices) {
    if (d.empty() || !std::all_of(d.begin(), d.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
      continue;
    }
    try {
      (void)std::stoi(d);
    } catch (const std::out_of_range&) {
      throw std::runtime_error("camera device index out of range: " + d);
    }
  }
  if (c.actuator.can.duration_ms <= 0 || c.actuator.plastic.duration_ms <= 0) {
    throw std::runtime_error("actuator durations must be positive");
  }
  if (c.actuator.can.pin == c.actuator.plastic.pin) {
    throw std::runtime_error("actuator channels must use different pins");
  }
  if (c.peripheral.connect_timeout_ms <= 0 || c.peripheral.request_timeout_ms <= 0) {
    throw std::runtime_error("peripheral timeouts must be positive");
  }
  if (c.inference.input_layout != "nhwc" && c.inference.input_layout != "nchw") {
    throw std::runtime_error("inference.input_layout must be 'nhwc' or 'nchw'");
  }
}

std::unique_ptr<CaptureSource> make_capture_source(const AppConfig& c) {
  if (c.session.capture_mode == "local") {
    return std::make_unique<LocalCameraSource>(c.camera, c.peripheral.id);
  }
  return std::make_unique<RemoteCameraSource>(c.peripheral);
}

std::unique_ptr<ActuatorController> make_actuator(const AppConfig& c) {
  if (c.session.actuator_mode == "local") {
    return std::make_unique<LocalActuator>(c.actuator,
                                           std::make_unique<SysfsGpioOutput>(c.actuator.gpio_root));
  }
  return std::make_unique<RemoteActuator>(c.peripheral, c.actuator);
}

std::unique_ptr<SessionController> build_session_controller(const AppConfig& c,
                                                            std::unique_ptr<InferenceEngine> engine,
                                                            MetricsRegistry& metrics,
                                                            CycleRecorder* recorder) {
  auto controller = std::make_unique<SessionController>(std::move(engine), metrics, recorder);
  controller->register_peripheral(c.peripheral.id, make_capture_source(c), make_actuator(c));
  spdlog::info("Peripheral '{}' at {}:{} (capture: {}, actuator: {})", c.peripheral.id,
               c.peripheral.host, c.peripheral.port, c.session.capture_mode,
               c.session.actuator_mode);
  return controller;
}
