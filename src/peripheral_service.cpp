#include "peripheral_service.hpp"

#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "inference_engine.hpp"
#include "wire.hpp"

namespace {

Reply failure(const StageError& e) {
  return {http_status_for(e.kind()), error_body(e.kind(), e.what())};
}

Reply busy() { return {kBusyStatus, busy_body()}; }

void send(httplib::Response& res, const Reply& r) {
  res.status = r.status;
  res.set_content(r.body.dump(), "application/json");
}

}  // namespace

PeripheralService::PeripheralService(std::unique_ptr<CaptureSource> camera,
                                     std::unique_ptr<ActuatorController> actuator)
    : camera_(std::move(camera)), actuator_(std::move(actuator)) {
  if (!camera_ || !actuator_) {
    throw std::runtime_error("PeripheralService needs a camera and an actuator");
  }
}

PeripheralService::~PeripheralService() { shutdown(); }

void PeripheralService::shutdown() {
  std::lock_guard<std::mutex> g(hw_mu_);
  camera_->release();
}

Reply PeripheralService::status() const {
  return {200,
          {{"status", "online"},
           {"message", "Peripheral server is ready"},
           {"camera_available", camera_->available()},
           {"gpio_initialized", actuator_->ready()}}};
}

Reply PeripheralService::capture() {
  std::unique_lock<std::mutex> lk(hw_mu_, std::try_to_lock);
  if (!lk.owns_lock()) return busy();

  spdlog::info("Capture request received");
  try {
    CaptureResult r = camera_->capture();
    std::string encoded = base64_encode(r.image);
    spdlog::info("Captured {}x{} frame, {} base64 chars", r.width, r.height, encoded.size());
    return {200, {{"status", "success"}, {"image", std::move(encoded)}}};
  } catch (const StageError& e) {
    spdlog::error("Capture error: {}", e.what());
    return failure(e);
  } catch (const std::exception& e) {
    spdlog::error("Capture error: {}", e.what());
    return {500, error_body(ErrorKind::CaptureUnavailable, e.what())};
  }
}

Reply PeripheralService::motor(const std::string& request_body) {
  nlohmann::json req = nlohmann::json::parse(request_body, nullptr, /*allow_exceptions=*/false);
  auto pred = req.is_object() ? req.find("prediction") : req.end();
  if (!req.is_object() || pred == req.end() || !pred->is_string()) {
    return {400, error_body(ErrorKind::ProtocolError,
                            "Missing prediction. Expected {\"prediction\": \"can\"/\"plastic\"}")};
  }

  const std::string prediction = pred->get<std::string>();
  auto target = parse_item_class(prediction);
  if (!target) {
    return {400, error_body(ErrorKind::ActuationError, "Unknown prediction: " + prediction)};
  }

  std::unique_lock<std::mutex> lk(hw_mu_, std::try_to_lock);
  if (!lk.owns_lock()) return busy();

  spdlog::info("Motor request: {}", prediction);
  try {
    ActuationCommand cmd = actuator_->activate(*target);
    const double secs = static_cast<double>(cmd.duration.count()) / 1000.0;
    return {200,
            {{"status", "success"},
             {"message", fmt::format("{} motor activated for {:.1f}s", label_name(*target), secs)},
             {"prediction", prediction}}};
  } catch (const StageError& e) {
    spdlog::error("Motor error: {}", e.what());
    return failure(e);
  } catch (const std::exception& e) {
    spdlog::error("Motor error: {}", e.what());
    return {500, error_body(ErrorKind::ActuationError, e.what())};
  }
}

Reply PeripheralService::test() {
  std::unique_lock<std::mutex> lk(hw_mu_, std::try_to_lock);
  if (!lk.owns_lock()) return busy();

  try {
    CaptureResult r = camera_->capture();
    cv::Mat frame = decode_image(r.image);
    actuator_->initialize();
    return {200,
            {{"status", "success"},
             {"message", "Camera and GPIO ready"},
             {"camera_shape", {frame.rows, frame.cols, frame.channels()}},
             {"gpio_initialized", actuator_->ready()}}};
  } catch (const StageError& e) {
    spdlog::error("Self-test failed: {}", e.what());
    return failure(e);
  } catch (const std::exception& e) {
    spdlog::error("Self-test failed: {}", e.what());
    return {500, {{"status", "error"}, {"message", e.what()}}};
  }
}

void PeripheralService::bind(httplib::Server& svr) {
  svr.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
    send(res, status());
  });
  svr.Get("/api/capture", [this](const httplib::Request&, httplib::Response& res) {
    send(res, capture());
  });
  svr.Post("/api/motor", [this](const httplib::Request& req, httplib::Response& res) {
    send(res, motor(req.body));
  });
  svr.Get("/api/test", [this](const httplib::Request&, httplib::Response& res) {
    send(res, test());
  });
}
