#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include "test_fakes.hpp"
#include "util.hpp"

class ConfigLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "binsort_config_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(test_dir / filename);
        file << content;
        file.close();
        return (test_dir / filename).string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoadTest, FullConfigLoad) {
    const std::string config_content = R"(
peripheral:
  id: bin-pi
  host: 192.168.1.50
  port: 6001
  connect_timeout_ms: 1500
  request_timeout_ms: 4000

camera:
  devices: [/dev/v4l/by-id/usb-cam-video-index0, 0]
  width: 1280
  height: 720
  jpeg_quality: 90

actuator:
  gpio_root: /tmp/gpio
  channels:
    can:
      pin: 5
      duration_ms: 800
    plastic:
      pin: 6
      duration_ms: 1600

inference:
  model_path: models/waste.onnx
  input_width: 160
  input_height: 160
  input_layout: nchw

session:
  capture: local
  actuator: local
  auto_start: false

server:
  host: 127.0.0.1
  port: 8080

peripheral_service:
  port: 6001

logging:
  level: debug
  verbose: true
  summary_interval: 30
  cycle_log_path: output/cycles.csv
)";

    AppConfig config = load_config(createTestConfig("full.yaml", config_content));

    EXPECT_EQ(config.peripheral.id, "bin-pi");
    EXPECT_EQ(config.peripheral.host, "192.168.1.50");
    EXPECT_EQ(config.peripheral.port, 6001);
    EXPECT_EQ(config.peripheral.connect_timeout_ms, 1500);
    EXPECT_EQ(config.peripheral.request_timeout_ms, 4000);

    std::vector<std::string> expected_devices = {"/dev/v4l/by-id/usb-cam-video-index0", "0"};
    EXPECT_EQ(config.camera.devices, expected_devices);
    EXPECT_EQ(config.camera.width, 1280);
    EXPECT_EQ(config.camera.height, 720);
    EXPECT_EQ(config.camera.jpeg_quality, 90);

    EXPECT_EQ(config.actuator.gpio_root, "/tmp/gpio");
    EXPECT_EQ(config.actuator.can.pin, 5);
    EXPECT_EQ(config.actuator.can.duration_ms, 800);
    EXPECT_EQ(config.actuator.plastic.pin, 6);
    EXPECT_EQ(config.actuator.plastic.duration_ms, 1600);

    EXPECT_EQ(config.inference.model_path, "models/waste.onnx");
    EXPECT_EQ(config.inference.input_size, cv::Size(160, 160));
    EXPECT_EQ(config.inference.input_layout, "nchw");

    EXPECT_EQ(config.session.capture_mode, "local");
    EXPECT_EQ(config.session.actuator_mode, "local");
    EXPECT_FALSE(config.session.auto_start);

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.peripheral_service.host, "0.0.0.0");
    EXPECT_EQ(config.peripheral_service.port, 6001);

    EXPECT_EQ(config.recorder.log_level, "debug");
    EXPECT_TRUE(config.recorder.verbose_logging);
    EXPECT_EQ(config.recorder.summary_interval, 30);
    EXPECT_EQ(config.recorder.csv_output_path, "output/cycles.csv");
}

TEST_F(ConfigLoadTest, EmptyConfig) {
    AppConfig config = load_config(createTestConfig("empty.yaml", "{}"));

    EXPECT_EQ(config.peripheral.port, 5001);
    EXPECT_EQ(config.camera.devices.size(), 3u);
    EXPECT_EQ(config.actuator.can.pin, 17);
    EXPECT_EQ(config.actuator.can.duration_ms, 1000);
    EXPECT_EQ(config.actuator.plastic.pin, 27);
    EXPECT_EQ(config.actuator.plastic.duration_ms, 2000);
    EXPECT_EQ(config.session.capture_mode, "remote");
    EXPECT_TRUE(config.session.auto_start);
    EXPECT_EQ(config.server.port, 5000);
    EXPECT_EQ(config.peripheral_service.port, 5001);
}

TEST_F(ConfigLoadTest, PartialChannelOverride) {
    const std::string config_content = R"(
actuator:
  channels:
    plastic:
      duration_ms: 2500
)";

    AppConfig config = load_config(createTestConfig("partial.yaml", config_content));
    EXPECT_EQ(config.actuator.plastic.duration_ms, 2500);
    EXPECT_EQ(config.actuator.plastic.pin, 27);
    EXPECT_EQ(config.actuator.can.duration_ms, 1000);
}

TEST_F(ConfigLoadTest, InvalidValuesRejected) {
    EXPECT_THROW(load_config(createTestConfig("mode.yaml", "session:\n  capture: usb\n")),
                 std::runtime_error);
    EXPECT_THROW(load_config(createTestConfig("devices.yaml", "camera:\n  devices: []\n")),
                 std::runtime_error);
    EXPECT_THROW(load_config(createTestConfig(
                     "pins.yaml", "actuator:\n  channels:\n    plastic:\n      pin: 17\n")),
                 std::runtime_error);
    EXPECT_THROW(load_config(createTestConfig(
                     "duration.yaml", "actuator:\n  channels:\n    can:\n      duration_ms: 0\n")),
                 std::runtime_error);
    EXPECT_THROW(load_config(createTestConfig("layout.yaml", "inference:\n  input_layout: nwhc\n")),
                 std::runtime_error);
}

TEST_F(ConfigLoadTest, OversizedDeviceIndexRejected) {
    EXPECT_THROW(load_config(createTestConfig("index.yaml", "camera:\n  devices: [99999999999999]\n")),
                 std::runtime_error);

    auto config = load_config(createTestConfig("index_ok.yaml", "camera:\n  devices: [2147483647, /dev/video0]\n"));
    EXPECT_EQ(config.camera.devices.size(), 2u);
}

TEST_F(ConfigLoadTest, InvalidFile) {
    EXPECT_THROW(load_config("/nonexistent/path/config.yaml"), std::exception);
}

TEST_F(ConfigLoadTest, MalformedYAML) {
    const std::string malformed_content = R"(
camera:
  devices: [0, 1
  width: "wide
)";
    EXPECT_THROW(load_config(createTestConfig("malformed.yaml", malformed_content)), std::exception);
}

class FactoryTest : public ::testing::Test {
protected:
    AppConfig config;
};

TEST_F(FactoryTest, RemoteVariantsByDefault) {
    auto capture = make_capture_source(config);
    auto actuator = make_actuator(config);
    EXPECT_NE(dynamic_cast<RemoteCameraSource*>(capture.get()), nullptr);
    EXPECT_NE(dynamic_cast<RemoteActuator*>(actuator.get()), nullptr);
}

TEST_F(FactoryTest, LocalVariantsOnRequest) {
    config.session.capture_mode = "local";
    config.session.actuator_mode = "local";
    auto capture = make_capture_source(config);
    auto actuator = make_actuator(config);
    EXPECT_NE(dynamic_cast<LocalCameraSource*>(capture.get()), nullptr);
    EXPECT_NE(dynamic_cast<LocalActuator*>(actuator.get()), nullptr);
    EXPECT_FALSE(actuator->ready());  // pins are set up on first use
}

TEST_F(FactoryTest, ControllerRegistersConfiguredPeripheral) {
    config.peripheral.id = "bin-pi";
    MetricsRegistry metrics;
    auto controller = build_session_controller(config, std::make_unique<FakeEngine>(), metrics, nullptr);
    EXPECT_EQ(controller->peripherals(), std::vector<std::string>{"bin-pi"});
    EXPECT_FALSE(controller->snapshot().running());
}
