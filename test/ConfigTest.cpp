#include "app/Config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>

namespace {

const char* kFullConfig = R"(
system:
  name: "Test Arm"
  version: "2.0.0"
hardware:
  pwm:
    backend: "sysfs"
    sysfs_chip: "/sys/class/pwm/pwmchip2"
    frequency: 50
    center_duty_cycle: 0.075
    min_duty_cycle: 0.05
    max_duty_cycle: 0.10
  start_speed: 0.3
  servos:
    base:
      name: "base"
      pin: 17
    gripper:
      name: "gripper"
      pin: 27
      channel: 1
safety:
  command_timeout: 2000
  emergency_stop_timeout: 100
  global_max_speed: 80
api:
  host: "127.0.0.1"
  port: 9000
  cors:
    enabled: false
    allowed_origins: ["http://localhost:3000"]
  rate_limiting:
    requests_per_minute: 120
    burst_limit: 5
logging:
  level: "DEBUG"
  max_file_size: "512KB"
  backup_count: 3
)";

TEST(ConfigTest, ParsesEverySection) {
    const AppConfig cfg = load_config_from_string(kFullConfig);

    EXPECT_EQ(cfg.system.name, "Test Arm");
    EXPECT_EQ(cfg.hardware.pwm_backend, "sysfs");
    EXPECT_EQ(cfg.hardware.sysfs_chip, "/sys/class/pwm/pwmchip2");
    EXPECT_DOUBLE_EQ(cfg.hardware.calibration.center, 0.075);
    EXPECT_DOUBLE_EQ(cfg.hardware.start_speed, 0.3);

    ASSERT_EQ(cfg.hardware.servos.size(), 2u);
    EXPECT_EQ(cfg.hardware.servos[0].id, "base");
    EXPECT_EQ(cfg.hardware.servos[0].pin, 17);
    EXPECT_EQ(cfg.hardware.servos[0].channel, -1);
    EXPECT_EQ(cfg.hardware.servos[1].id, "gripper");
    EXPECT_EQ(cfg.hardware.servos[1].channel, 1);

    EXPECT_EQ(cfg.safety.command_timeout_ms, 2000);
    EXPECT_EQ(cfg.safety.global_max_speed, 80);

    EXPECT_EQ(cfg.api.host, "127.0.0.1");
    EXPECT_EQ(cfg.api.port, 9000);
    EXPECT_FALSE(cfg.api.cors.enabled);
    EXPECT_EQ(cfg.api.cors.allowed_origins, std::vector<std::string>{"http://localhost:3000"});
    EXPECT_EQ(cfg.api.rate_limiting.requests_per_minute, 120);
    EXPECT_EQ(cfg.api.rate_limiting.burst_limit, 5);

    EXPECT_EQ(cfg.logging.level, "DEBUG");
    EXPECT_EQ(cfg.logging.max_file_size, 512u * 1024u);
    EXPECT_EQ(cfg.logging.backup_count, 3);
}

TEST(ConfigTest, MissingSectionsFallBackToDefaults) {
    const AppConfig cfg = load_config_from_string("system:\n  name: x\n");
    EXPECT_TRUE(cfg.hardware.servos.empty());
    EXPECT_EQ(cfg.hardware.pwm_backend, "sysfs");
    EXPECT_DOUBLE_EQ(cfg.hardware.calibration.center, 0.0696);
    EXPECT_EQ(cfg.api.port, 8000);
    EXPECT_TRUE(cfg.safety.enabled);
    EXPECT_EQ(cfg.logging.level, "INFO");
}

TEST(ConfigTest, EmptyDocumentIsRejected) {
    EXPECT_THROW(load_config_from_string(""), std::runtime_error);
}

TEST(ConfigTest, ServoWithoutPinIsRejected) {
    EXPECT_THROW(load_config_from_string("hardware:\n  servos:\n    base:\n      name: base\n"),
                 std::runtime_error);
}

TEST(ConfigTest, NonIntegerPinIsRejected) {
    EXPECT_THROW(load_config_from_string("hardware:\n  servos:\n    base:\n      pin: seventeen\n"),
                 std::runtime_error);
}

TEST(ConfigTest, OutOfRangeValuesAreRejected) {
    EXPECT_THROW(load_config_from_string("safety:\n  global_max_speed: 150\n"), std::runtime_error);
    EXPECT_THROW(load_config_from_string("safety:\n  command_timeout: 10\n"), std::runtime_error);
    EXPECT_THROW(load_config_from_string("api:\n  port: 80\n"), std::runtime_error);
    EXPECT_THROW(load_config_from_string("logging:\n  level: VERBOSE\n"), std::runtime_error);
    EXPECT_THROW(load_config_from_string("hardware:\n  pwm:\n    backend: pigpio\n"), std::runtime_error);
}

TEST(ConfigTest, InvalidCalibrationIsRejected) {
    EXPECT_THROW(load_config_from_string("hardware:\n  pwm:\n    center_duty_cycle: 0.2\n"),
                 std::runtime_error);
}

TEST(ConfigTest, ByteSizes) {
    EXPECT_EQ(parse_byte_size("10MB"), 10u * 1024u * 1024u);
    EXPECT_EQ(parse_byte_size("512 kb"), 512u * 1024u);
    EXPECT_EQ(parse_byte_size("4096"), 4096u);
    EXPECT_THROW(parse_byte_size("lots"), std::runtime_error);
    EXPECT_THROW(parse_byte_size("MB"), std::runtime_error);
}

TEST(ConfigTest, LoadsFromFile) {
    char path[] = "/tmp/servo_arm_configXXXXXX";
    const int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);
    {
        std::ofstream out(path);
        out << kFullConfig;
    }
    const AppConfig cfg = load_config_from_file(path);
    std::remove(path);
    EXPECT_EQ(cfg.hardware.servos.size(), 2u);
}

TEST(ConfigTest, MissingFileIsReported) {
    EXPECT_THROW(load_config_from_file("/nonexistent/config.yaml"), std::runtime_error);
}

}  // namespace
