#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>
#include <opencv2/opencv.hpp>

#include "types.hpp"

// Inference configuration
struct InferenceConfig {
    std::string model_path = "models/classifier.onnx";
    cv::Size input_size{224, 224};
    // "nhwc" for Keras/TFLite exports, "nchw" for PyTorch-style exports
    std::string input_layout = "nhwc";
};

// Label and confidence from P(Plastic). Throws ClassificationError for p outside [0,1].
ClassificationResult derive_classification(double p);

// Two decimals, as reported on the wire.
double round_confidence(double confidence);

// JPEG/PNG bytes to a BGR image. Throws ProtocolError when the bytes do not decode.
cv::Mat decode_image(const std::vector<unsigned char>& bytes);

// Scalar binary classifier. Implementations must be side-effect free.
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    // P(Plastic | image) for a BGR frame of any size.
    virtual double predict(const cv::Mat& bgr) = 0;
};

// OpenCV DNN backed classifier
class DnnInferenceEngine : public InferenceEngine {
public:
    explicit DnnInferenceEngine(const InferenceConfig& config = InferenceConfig{});

    bool initialize();
    double predict(const cv::Mat& bgr) override;

    // RGB, resized, float32 in [0,255]; the model carries its own normalisation.
    cv::Mat preprocess(const cv::Mat& bgr) const;

    const InferenceConfig& getConfig() const { return config_; }

    struct PerformanceStats {
        float avg_preprocessing_time{0.0f};
        float avg_inference_time{0.0f};
        int frames_processed{0};

        void update(float preprocessing, float inference);
        void reset();
    };

    PerformanceStats getStats() const;

private:
    InferenceConfig config_;
    cv::dnn::Net net_;
    bool loaded_{false};

    // cv::dnn::Net is not reentrant
    mutable std::mutex net_mu_;
    PerformanceStats stats_;

    std::chrono::steady_clock::time_point timer_start_;
    void startTimer();
    float getElapsedMs();
};

// Decode, predict and derive. Every failure surfaces as a StageError.
ClassificationResult classify_image(InferenceEngine& engine, const std::vector<unsigned char>& bytes);

std::unique_ptr<InferenceEngine> createInferenceEngine(const InferenceConfig& config = InferenceConfig{});
