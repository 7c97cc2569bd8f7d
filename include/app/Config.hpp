#pragma once
#include "control/DutyCycle.hpp"
#include "control/ServoTypes.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Keep config structs simple & POD-like.
struct SystemConfig {
    std::string name = "Robot Arm Control System";
    std::string version = "1.0.0";
    bool debug_mode = false;
    std::string log_level = "INFO";
};

struct HardwareConfig {
    std::string pwm_backend = "sysfs";               // "sysfs" | "gpiod"
    std::string sysfs_chip = "/sys/class/pwm/pwmchip0";
    std::string gpio_chip = "gpiochip0";
    PwmCalibration calibration;
    double start_speed = 0.5;                        // used by /start
    std::vector<ServoDescriptor> servos;             // file order
};

struct SafetyConfig {
    bool enabled = true;
    bool emergency_stop_enabled = true;
    bool bounds_checking_enabled = true;
    bool speed_limiting_enabled = true;
    bool timeout_protection_enabled = true;

    int command_timeout_ms = 5000;
    int movement_timeout_ms = 10000;
    int emergency_stop_timeout_ms = 100;

    int global_max_speed = 100;                      // percent
    int global_max_acceleration = 50;                // percent, not enforced

    bool power_monitoring_enabled = false;
    double max_current_draw = 2.0;
    bool voltage_monitoring_enabled = false;
    double min_voltage = 4.5;
};

struct CorsConfig {
    bool enabled = true;
    std::vector<std::string> allowed_origins{"*"};
    std::vector<std::string> allowed_methods{"GET", "POST", "PUT", "DELETE"};
    std::vector<std::string> allowed_headers{"*"};
};

struct RateLimitConfig {
    bool enabled = true;
    int requests_per_minute = 60;
    int burst_limit = 10;
};

// Parsed only; nothing enforces it yet.
struct AuthConfig {
    bool enabled = false;
    bool api_key_required = false;
    bool jwt_enabled = false;
};

struct ApiConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    bool debug = false;
    int workers = 4;
    CorsConfig cors;
    RateLimitConfig rate_limiting;
    AuthConfig authentication;
};

struct LoggingConfig {
    std::string level = "INFO";
    bool file_enabled = false;
    std::string file_path = "logs/robot_arm.log";
    std::size_t max_file_size = 10 * 1024 * 1024;
    int backup_count = 5;
    bool console_enabled = true;
};

struct AppConfig {
    SystemConfig system;
    HardwareConfig hardware;
    SafetyConfig safety;
    ApiConfig api;
    LoggingConfig logging;
};

// Throws std::runtime_error on parse or validation errors.
AppConfig load_config_from_file(const std::string& path);
AppConfig load_config_from_string(const std::string& yaml);

// "10MB", "512KB", "1GB" or a plain byte count. Throws std::runtime_error.
std::size_t parse_byte_size(const std::string& text);
