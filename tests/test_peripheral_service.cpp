#include <gtest/gtest.h>
#include <future>
#include "peripheral_service.hpp"
#include "test_fakes.hpp"

class PeripheralServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto cam = std::make_unique<FakeCapture>();
        capture = cam.get();
        auto act = std::make_unique<FakeActuator>();
        actuator = act.get();
        service = std::make_unique<PeripheralService>(std::move(cam), std::move(act));
    }

    std::unique_ptr<PeripheralService> service;
    FakeCapture* capture{nullptr};
    FakeActuator* actuator{nullptr};
};

TEST_F(PeripheralServiceTest, RequiresCameraAndActuator) {
    EXPECT_THROW(PeripheralService(nullptr, std::make_unique<FakeActuator>()), std::runtime_error);
}

TEST_F(PeripheralServiceTest, StatusReportsHardware) {
    Reply r = service->status();
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body["status"], "online");
    EXPECT_TRUE(r.body["camera_available"].get<bool>());
    EXPECT_TRUE(r.body["gpio_initialized"].get<bool>());
}

TEST_F(PeripheralServiceTest, CaptureReturnsBase64Jpeg) {
    Reply r = service->capture();
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["status"], "success");
    auto jpeg = base64_decode(r.body["image"].get<std::string>());
    EXPECT_EQ(jpeg, test_jpeg());
}

TEST_F(PeripheralServiceTest, CaptureFailureIsErrorBody) {
    capture->fail_with = ErrorKind::CaptureUnavailable;
    Reply r = service->capture();
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body["status"], "error");
    EXPECT_EQ(r.body["error"], "CaptureUnavailable");
}

TEST_F(PeripheralServiceTest, MotorRunsRequestedChannel) {
    Reply r = service->motor(R"({"prediction": "plastic"})");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["status"], "success");
    EXPECT_EQ(r.body["prediction"], "plastic");
    EXPECT_EQ(r.body["message"], "Plastic motor activated for 2.0s");
    ASSERT_EQ(actuator->activation_count(), 1u);
    EXPECT_EQ(actuator->activations[0], ItemClass::Plastic);
}

TEST_F(PeripheralServiceTest, MotorAcceptsDisplayCase) {
    Reply r = service->motor(R"({"prediction": "Can"})");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["message"], "Can motor activated for 1.0s");
    EXPECT_EQ(actuator->activations.at(0), ItemClass::Can);
}

TEST_F(PeripheralServiceTest, MotorRejectsMissingOrUnknownPrediction) {
    for (const char* body : {"", "not json", "[]", "{}", R"({"prediction": 3})"}) {
        Reply r = service->motor(body);
        EXPECT_EQ(r.status, 400) << body;
        EXPECT_EQ(r.body["error"], "ProtocolError") << body;
    }

    Reply r = service->motor(R"({"prediction": "glass"})");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body["error"], "ActuationError");
    EXPECT_EQ(r.body["message"], "Unknown prediction: glass");
    EXPECT_EQ(actuator->activation_count(), 0u);
}

TEST_F(PeripheralServiceTest, MotorFailureIsReported) {
    actuator->fail_with = ErrorKind::ActuationError;
    Reply r = service->motor(R"({"prediction": "can"})");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.body["error"], "ActuationError");
}

TEST_F(PeripheralServiceTest, HardwareBusyWhileMotorRuns) {
    Gate entered, release;
    actuator->entered = &entered;
    actuator->hold = &release;

    auto first = std::async(std::launch::async, [&] { return service->motor(R"({"prediction": "can"})"); });
    ASSERT_TRUE(entered.wait_for(std::chrono::seconds(5)));

    Reply second = service->motor(R"({"prediction": "plastic"})");
    EXPECT_EQ(second.status, kBusyStatus);
    EXPECT_TRUE(second.body["busy"].get<bool>());

    Reply cap = service->capture();
    EXPECT_EQ(cap.status, kBusyStatus);
    EXPECT_EQ(capture->captures.load(), 0);

    // status never waits on the hardware lock
    EXPECT_EQ(service->status().status, 200);

    release.open();
    EXPECT_EQ(first.get().status, 200);
    EXPECT_EQ(actuator->activation_count(), 1u);
}

TEST_F(PeripheralServiceTest, SelfTestReportsCameraShape) {
    Reply r = service->test();
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["camera_shape"], nlohmann::json({48, 64, 3}));
    EXPECT_TRUE(r.body["gpio_initialized"].get<bool>());
}

TEST_F(PeripheralServiceTest, ShutdownReleasesCamera) {
    service->shutdown();
    EXPECT_GE(capture->releases.load(), 1);
}
