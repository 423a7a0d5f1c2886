#include "capture_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "inference_engine.hpp"

namespace {

bool is_index(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace

std::vector<unsigned char> encode_jpeg(const cv::Mat& frame, int quality) {
  if (frame.empty()) {
    throw StageError(ErrorKind::CaptureUnavailable, "empty frame");
  }
  std::vector<unsigned char> buf;
  bool ok = false;
  try {
    ok = cv::imencode(".jpg", frame, buf, {cv::IMWRITE_JPEG_QUALITY, quality});
  } catch (const cv::Exception& e) {
    throw StageError(ErrorKind::CaptureUnavailable, std::string("failed to encode image: ") + e.what());
  }
  if (!ok) {
    throw StageError(ErrorKind::CaptureUnavailable, "failed to encode image");
  }
  return buf;
}

LocalCameraSource::LocalCameraSource(CameraConfig cfg, std::string peripheral_id)
    : cfg_(std::move(cfg)), peripheral_id_(std::move(peripheral_id)) {
  if (cfg_.devices.empty()) {
    throw std::runtime_error("camera.devices must list at least one candidate");
  }
}

LocalCameraSource::~LocalCameraSource() { release(); }

bool LocalCameraSource::open_device(const std::string& device) {
  spdlog::info("Trying camera {}...", device);
  bool opened = false;
  if (is_index(device)) {
    int index = 0;
    try {
      index = std::stoi(device);
    } catch (const std::out_of_range&) {
      spdlog::warn("Camera index {} is out of range, skipping", device);
      return false;
    }
    opened = cap_.open(index);
  } else {
    opened = cap_.open(device);
  }
  if (!opened || !cap_.isOpened()) {
    cap_.release();
    return false;
  }
  // A device that opens but cannot deliver a frame is not usable.
  cv::Mat first;
  if (!cap_.read(first) || first.empty()) {
    spdlog::warn("Camera {} opened but returned no frame", device);
    cap_.release();
    return false;
  }
  cap_.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  active_device_ = device;
  open_ = true;
  spdlog::info("Camera {} works ({}x{} requested)", device, cfg_.width, cfg_.height);
  return true;
}

void LocalCameraSource::ensure_open() {
  if (cap_.isOpened()) return;
  active_device_.clear();
  for (const auto& device : cfg_.devices) {
    if (open_device(device)) return;
  }
  throw StageError(ErrorKind::CaptureUnavailable,
                   "no working camera among " + std::to_string(cfg_.devices.size()) + " candidates");
}

cv::Mat LocalCameraSource::grab_frame() {
  std::lock_guard<std::mutex> g(mu_);
  ensure_open();
  cv::Mat frame;
  if (!cap_.read(frame) || frame.empty()) {
    // Drop the handle so the next capture goes through the candidate list again.
    cap_.release();
    active_device_.clear();
    open_ = false;
    throw StageError(ErrorKind::CaptureUnavailable, "failed to capture image");
  }
  return frame;
}

CaptureResult LocalCameraSource::capture() {
  cv::Mat frame = grab_frame();
  CaptureResult r;
  r.image = encode_jpeg(frame, cfg_.jpeg_quality);
  r.width = frame.cols;
  r.height = frame.rows;
  r.peripheral_id = peripheral_id_;
  r.captured_at = WallClock::now();
  spdlog::debug("Captured {}x{} frame ({} bytes)", r.width, r.height, r.image.size());
  return r;
}

bool LocalCameraSource::available() const { return open_.load(); }

void LocalCameraSource::release() {
  std::lock_guard<std::mutex> g(mu_);
  open_ = false;
  if (cap_.isOpened()) {
    cap_.release();
    spdlog::info("Camera {} released", active_device_);
  }
  active_device_.clear();
}

std::string LocalCameraSource::active_device() const {
  std::lock_guard<std::mutex> g(mu_);
  return active_device_;
}

CaptureResult RemoteCameraSource::capture() {
  PeerResponse r = client_.get("/api/capture");
  raise_for_peer_error(r, ErrorKind::CaptureUnavailable);

  CaptureResult out;
  out.image = base64_decode(require_string(r.body, "image"));
  cv::Mat decoded = decode_image(out.image);
  out.width = decoded.cols;
  out.height = decoded.rows;
  out.peripheral_id = client_.config().id;
  out.captured_at = WallClock::now();
  spdlog::debug("Remote capture from {}: {}x{} ({} bytes)", out.peripheral_id, out.width,
                out.height, out.image.size());
  return out;
}

bool RemoteCameraSource::available() const {
  try {
    PeerResponse r = client_.get("/api/status");
    raise_for_peer_error(r, ErrorKind::CaptureUnavailable);
    return parse_peripheral_status(r.body).camera_available;
  } catch (const StageError& e) {
    spdlog::warn("Peripheral {} status check failed: {}", client_.config().id, e.what());
    return false;
  }
}
