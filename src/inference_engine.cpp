#include "inference_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

using namespace std::chrono;

ClassificationResult derive_classification(double p) {
  if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
    throw StageError(ErrorKind::ClassificationError,
                     "classifier output out of range: " + std::to_string(p));
  }
  ClassificationResult r;
  r.probability = p;
  r.label = p >= 0.5 ? ItemClass::Plastic : ItemClass::Can;
  r.confidence = std::max(p, 1.0 - p) * 100.0;
  return r;
}

double round_confidence(double confidence) { return std::round(confidence * 100.0) / 100.0; }

cv::Mat decode_image(const std::vector<unsigned char>& bytes) {
  if (bytes.empty()) {
    throw StageError(ErrorKind::ProtocolError, "empty image payload");
  }
  cv::Mat img;
  try {
    img = cv::imdecode(bytes, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    throw StageError(ErrorKind::ProtocolError, std::string("image decode failed: ") + e.what());
  }
  if (img.empty()) {
    throw StageError(ErrorKind::ProtocolError, "image payload is not a decodable image");
  }
  return img;
}

// Performance Stats Implementation
void DnnInferenceEngine::PerformanceStats::update(float preprocessing, float inference) {
  frames_processed++;
  float alpha = 1.0f / static_cast<float>(frames_processed);  // Simple moving average
  avg_preprocessing_time = avg_preprocessing_time * (1 - alpha) + preprocessing * alpha;
  avg_inference_time = avg_inference_time * (1 - alpha) + inference * alpha;
}

void DnnInferenceEngine::PerformanceStats::reset() {
  avg_preprocessing_time = avg_inference_time = 0.0f;
  frames_processed = 0;
}

DnnInferenceEngine::DnnInferenceEngine(const InferenceConfig& config) : config_(config) {
  if (config_.input_layout != "nhwc" && config_.input_layout != "nchw") {
    throw std::runtime_error("unsupported input layout: " + config_.input_layout);
  }
}

bool DnnInferenceEngine::initialize() {
  spdlog::info("Loading classifier from {}", config_.model_path);
  try {
    net_ = cv::dnn::readNet(config_.model_path);
  } catch (const cv::Exception& e) {
    spdlog::error("Failed to load classifier {}: {}", config_.model_path, e.what());
    return false;
  }
  if (net_.empty()) {
    spdlog::error("Classifier {} loaded as an empty network", config_.model_path);
    return false;
  }
  net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
  net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
  loaded_ = true;

  spdlog::info("Classifier ready");
  spdlog::info("  - Input: {}x{} ({})", config_.input_size.width, config_.input_size.height,
               config_.input_layout);
  return true;
}

cv::Mat DnnInferenceEngine::preprocess(const cv::Mat& bgr) const {
  cv::Mat rgb, resized, as_float;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  cv::resize(rgb, resized, config_.input_size);
  resized.convertTo(as_float, CV_32FC3);

  if (config_.input_layout == "nchw") {
    return cv::dnn::blobFromImage(as_float, 1.0, config_.input_size, cv::Scalar(),
                                  /*swapRB=*/false, /*crop=*/false, CV_32F);
  }

  // NHWC: the interleaved HxWx3 buffer already is the tensor body.
  const int sizes[] = {1, config_.input_size.height, config_.input_size.width, 3};
  cv::Mat blob(4, sizes, CV_32F);
  cv::Mat contiguous = as_float.isContinuous() ? as_float : as_float.clone();
  std::memcpy(blob.ptr<float>(), contiguous.ptr<float>(), contiguous.total() * contiguous.elemSize());
  return blob;
}

double DnnInferenceEngine::predict(const cv::Mat& bgr) {
  if (!loaded_) {
    throw StageError(ErrorKind::ClassificationError, "classifier not initialized");
  }
  if (bgr.empty()) {
    throw StageError(ErrorKind::ClassificationError, "empty frame");
  }

  std::lock_guard<std::mutex> g(net_mu_);
  try {
    startTimer();
    cv::Mat blob = preprocess(bgr);
    float pre_ms = getElapsedMs();

    startTimer();
    net_.setInput(blob);
    cv::Mat out = net_.forward();
    float inf_ms = getElapsedMs();
    stats_.update(pre_ms, inf_ms);

    if (out.total() != 1) {
      throw StageError(ErrorKind::ClassificationError,
                       "classifier produced " + std::to_string(out.total()) + " outputs, expected 1");
    }
    double p = static_cast<double>(out.ptr<float>()[0]);
    spdlog::debug("Classifier p={:.4f} (pre {:.2f}ms, infer {:.2f}ms)", p, pre_ms, inf_ms);
    return p;
  } catch (const cv::Exception& e) {
    throw StageError(ErrorKind::ClassificationError, std::string("inference failed: ") + e.what());
  }
}

DnnInferenceEngine::PerformanceStats DnnInferenceEngine::getStats() const {
  std::lock_guard<std::mutex> g(net_mu_);
  return stats_;
}

void DnnInferenceEngine::startTimer() { timer_start_ = steady_clock::now(); }

float DnnInferenceEngine::getElapsedMs() {
  return duration<float, std::milli>(steady_clock::now() - timer_start_).count();
}

ClassificationResult classify_image(InferenceEngine& engine, const std::vector<unsigned char>& bytes) {
  cv::Mat frame = decode_image(bytes);
  double p = 0.0;
  try {
    p = engine.predict(frame);
  } catch (const StageError&) {
    throw;
  } catch (const std::exception& e) {
    throw StageError(ErrorKind::ClassificationError, e.what());
  }
  return derive_classification(p);
}

std::unique_ptr<InferenceEngine> createInferenceEngine(const InferenceConfig& config) {
  auto engine = std::make_unique<DnnInferenceEngine>(config);
  if (!engine->initialize()) {
    throw std::runtime_error("classifier initialization failed");
  }
  return engine;
}
