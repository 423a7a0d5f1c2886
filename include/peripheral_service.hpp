#pragma once
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "actuator.hpp"
#include "capture_source.hpp"
#include "wire.hpp"

namespace httplib {
class Server;
}

// Capture and motor endpoints of the peripheral node. The camera and the motors
// share one hardware lock; a request that finds it held is answered 409 at once.
class PeripheralService {
public:
  PeripheralService(std::unique_ptr<CaptureSource> camera,
                    std::unique_ptr<ActuatorController> actuator);
  ~PeripheralService();

  Reply status() const;
  Reply capture();
  Reply motor(const std::string& request_body);
  Reply test();

  // Mounts the endpoints under /api.
  void bind(httplib::Server& svr);

  // Releases the camera; the actuator drives its channels low on destruction.
  void shutdown();

private:
  std::unique_ptr<CaptureSource> camera_;
  std::unique_ptr<ActuatorController> actuator_;

  std::mutex hw_mu_;
};
