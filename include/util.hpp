#pragma once
#include <memory>
#include <string>

#include "actuator.hpp"
#include "capture_source.hpp"
#include "cycle_recorder.hpp"
#include "inference_engine.hpp"
#include "session.hpp"
#include "wire.hpp"

struct ListenConfig {
  std::string host{"0.0.0.0"};
  int port{5000};
};

struct AppConfig {
  PeerConfig peripheral;
  CameraConfig camera;
  ActuatorConfig actuator;
  InferenceConfig inference;
  SessionConfig session;
  RecorderConfig recorder;
  ListenConfig server{"0.0.0.0", 5000};
  ListenConfig peripheral_service{"0.0.0.0", 5001};
};

// Every key is optional. Throws std::runtime_error on values that cannot work
// (unknown modes, empty device list, non-positive durations).
AppConfig load_config(const std::string& path);

void validate_config(const AppConfig& c);

// The capture/actuator variant is picked here, once, from session.capture and
// session.actuator; nothing downstream branches on local vs remote.
std::unique_ptr<CaptureSource> make_capture_source(const AppConfig& c);
std::unique_ptr<ActuatorController> make_actuator(const AppConfig& c);

std::unique_ptr<SessionController> build_session_controller(const AppConfig& c,
                                                            std::unique_ptr<InferenceEngine> engine,
                                                            MetricsRegistry& metrics,
                                                            CycleRecorder* recorder);
