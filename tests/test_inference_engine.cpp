#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "test_fakes.hpp"

// derive_classification: label from the 0.5 threshold, confidence from the
// distance to it.
TEST(DeriveClassificationTest, Extremes) {
    auto can = derive_classification(0.0);
    EXPECT_EQ(can.label, ItemClass::Can);
    EXPECT_DOUBLE_EQ(can.confidence, 100.0);

    auto plastic = derive_classification(1.0);
    EXPECT_EQ(plastic.label, ItemClass::Plastic);
    EXPECT_DOUBLE_EQ(plastic.confidence, 100.0);
}

TEST(DeriveClassificationTest, ThresholdGoesToPlastic) {
    auto r = derive_classification(0.5);
    EXPECT_EQ(r.label, ItemClass::Plastic);
    EXPECT_DOUBLE_EQ(r.confidence, 50.0);
}

TEST(DeriveClassificationTest, TypicalOutputs) {
    auto plastic = derive_classification(0.952);
    EXPECT_EQ(plastic.label, ItemClass::Plastic);
    EXPECT_DOUBLE_EQ(round_confidence(plastic.confidence), 95.2);
    EXPECT_DOUBLE_EQ(plastic.probability, 0.952);

    auto can = derive_classification(0.13);
    EXPECT_EQ(can.label, ItemClass::Can);
    EXPECT_DOUBLE_EQ(round_confidence(can.confidence), 87.0);
}

TEST(DeriveClassificationTest, ConfidenceStaysInRange) {
    for (int i = 0; i <= 100; ++i) {
        auto r = derive_classification(i / 100.0);
        EXPECT_GE(r.confidence, 50.0);
        EXPECT_LE(r.confidence, 100.0);
    }
}

TEST(DeriveClassificationTest, RejectsOutOfRangeOutputs) {
    for (double p : {-0.01, 1.01, std::numeric_limits<double>::quiet_NaN(),
                     std::numeric_limits<double>::infinity()}) {
        try {
            derive_classification(p);
            FAIL() << "accepted p=" << p;
        } catch (const StageError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::ClassificationError);
        }
    }
}

TEST(RoundConfidenceTest, TwoDecimals) {
    EXPECT_DOUBLE_EQ(round_confidence(87.456), 87.46);
    EXPECT_DOUBLE_EQ(round_confidence(50.0), 50.0);
    EXPECT_DOUBLE_EQ(round_confidence(99.994), 99.99);
}

TEST(DecodeImageTest, DecodesJpeg) {
    cv::Mat img = decode_image(test_jpeg(32, 24));
    EXPECT_EQ(img.cols, 32);
    EXPECT_EQ(img.rows, 24);
    EXPECT_EQ(img.channels(), 3);
}

TEST(DecodeImageTest, GarbageIsProtocolError) {
    std::vector<unsigned char> junk{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
    try {
        decode_image(junk);
        FAIL() << "expected ProtocolError";
    } catch (const StageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProtocolError);
    }
    EXPECT_THROW(decode_image({}), StageError);
}

class ClassifyImageTest : public ::testing::Test {
protected:
    FakeEngine engine{0.952};
};

TEST_F(ClassifyImageTest, DecodesPredictsAndDerives) {
    auto r = classify_image(engine, test_jpeg());
    EXPECT_EQ(r.label, ItemClass::Plastic);
    EXPECT_EQ(engine.calls.load(), 1);
}

TEST_F(ClassifyImageTest, EngineErrorsBecomeClassificationError) {
    engine.fail_with = ErrorKind::ClassificationError;
    try {
        classify_image(engine, test_jpeg());
        FAIL() << "expected ClassificationError";
    } catch (const StageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ClassificationError);
    }
}

TEST_F(ClassifyImageTest, OutOfRangeEngineOutput) {
    engine.set_probability(1.7);
    EXPECT_THROW(classify_image(engine, test_jpeg()), StageError);
}

class DnnInferenceEngineTest : public ::testing::Test {
protected:
    InferenceConfig config;
};

TEST_F(DnnInferenceEngineTest, DefaultConfig) {
    EXPECT_EQ(config.model_path, "models/classifier.onnx");
    EXPECT_EQ(config.input_size, cv::Size(224, 224));
    EXPECT_EQ(config.input_layout, "nhwc");
}

TEST_F(DnnInferenceEngineTest, NhwcBlobShape) {
    DnnInferenceEngine engine(config);
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(0, 0, 255));  // pure red in BGR
    cv::Mat blob = engine.preprocess(frame);

    ASSERT_EQ(blob.dims, 4);
    EXPECT_EQ(blob.size[0], 1);
    EXPECT_EQ(blob.size[1], 224);
    EXPECT_EQ(blob.size[2], 224);
    EXPECT_EQ(blob.size[3], 3);
    EXPECT_EQ(blob.type(), CV_32F);

    // RGB order, raw [0,255] values
    const float* px = blob.ptr<float>();
    EXPECT_FLOAT_EQ(px[0], 255.0f);
    EXPECT_FLOAT_EQ(px[1], 0.0f);
    EXPECT_FLOAT_EQ(px[2], 0.0f);
}

TEST_F(DnnInferenceEngineTest, NchwBlobShape) {
    config.input_layout = "nchw";
    config.input_size = cv::Size(96, 64);
    DnnInferenceEngine engine(config);
    cv::Mat blob = engine.preprocess(cv::Mat(100, 100, CV_8UC3, cv::Scalar(10, 20, 30)));

    ASSERT_EQ(blob.dims, 4);
    EXPECT_EQ(blob.size[0], 1);
    EXPECT_EQ(blob.size[1], 3);
    EXPECT_EQ(blob.size[2], 64);
    EXPECT_EQ(blob.size[3], 96);
}

TEST_F(DnnInferenceEngineTest, UnknownLayoutRejected) {
    config.input_layout = "chwn";
    EXPECT_THROW(DnnInferenceEngine engine(config), std::runtime_error);
}

TEST_F(DnnInferenceEngineTest, MissingModelFailsInitialization) {
    config.model_path = "/nonexistent/classifier.onnx";
    DnnInferenceEngine engine(config);
    EXPECT_FALSE(engine.initialize());
    EXPECT_THROW(engine.predict(cv::Mat(10, 10, CV_8UC3)), StageError);
    EXPECT_THROW(createInferenceEngine(config), std::runtime_error);
}
