#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "types.hpp"
#include "wire.hpp"

struct CameraConfig {
  // Tried in order; an all-digit entry is a device index, anything else a path.
  std::vector<std::string> devices{"0", "1", "2"};
  int width{640};
  int height{480};
  int jpeg_quality{95};
};

class CaptureSource {
public:
  virtual ~CaptureSource() = default;

  // One physical capture. Throws StageError.
  virtual CaptureResult capture() = 0;
  virtual bool available() const = 0;
  virtual void release() {}
};

class LocalCameraSource : public CaptureSource {
public:
  LocalCameraSource(CameraConfig cfg, std::string peripheral_id);
  ~LocalCameraSource() override;

  CaptureResult capture() override;
  bool available() const override;
  void release() override;

  // Grabs one raw frame, opening the device if needed.
  cv::Mat grab_frame();

  // Device string of the candidate currently open, empty if none.
  std::string active_device() const;

private:
  CameraConfig cfg_;
  std::string peripheral_id_;

  mutable std::mutex mu_;
  cv::VideoCapture cap_;
  std::string active_device_;
  // Mirrors cap_.isOpened() so status queries never wait behind a capture.
  std::atomic<bool> open_{false};

  bool open_device(const std::string& device);
  void ensure_open();
};

// Camera of a peripheral reached over HTTP. Never retries.
class RemoteCameraSource : public CaptureSource {
public:
  explicit RemoteCameraSource(PeerConfig peer) : client_(std::move(peer)) {}

  CaptureResult capture() override;
  // Queries /api/status; false when the peer cannot be reached.
  bool available() const override;

private:
  PeerClient client_;
};

std::vector<unsigned char> encode_jpeg(const cv::Mat& frame, int quality);
