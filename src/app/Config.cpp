#include "app/Config.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <set>

template <typename T>
static void check_range(T value, T lo, T hi, const std::string& key) {
    if (value < lo || value > hi) {
        throw std::runtime_error("Config value " + key + " out of range [" +
                                 std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

static std::vector<std::string> as_string_list(const YAML::Node& node,
                                               const std::vector<std::string>& fallback) {
    if (!node || !node.IsSequence()) return fallback;
    std::vector<std::string> out;
    for (const auto& item : node) out.push_back(item.as<std::string>());
    return out;
}

std::size_t parse_byte_size(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    std::size_t mult = 1;
    auto endsWith = [&](const std::string& suffix) {
        return s.size() > suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (endsWith("GB"))      { mult = 1024ull * 1024 * 1024; s.resize(s.size() - 2); }
    else if (endsWith("MB")) { mult = 1024ull * 1024;        s.resize(s.size() - 2); }
    else if (endsWith("KB")) { mult = 1024ull;               s.resize(s.size() - 2); }
    else if (endsWith("B"))  {                               s.resize(s.size() - 1); }

    if (s.empty() || !std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw std::runtime_error("Invalid size value: '" + text + "'");
    }
    return static_cast<std::size_t>(std::stoull(s)) * mult;
}

static SystemConfig parse_system(const YAML::Node& node) {
    SystemConfig cfg;
    if (!node || !node.IsMap()) return cfg;

    if (auto v = node["name"])       cfg.name = v.as<std::string>(cfg.name);
    if (auto v = node["version"])    cfg.version = v.as<std::string>(cfg.version);
    if (auto v = node["debug_mode"]) cfg.debug_mode = v.as<bool>(cfg.debug_mode);
    if (auto v = node["log_level"])  cfg.log_level = v.as<std::string>(cfg.log_level);
    return cfg;
}

static ServoDescriptor parse_servo(const std::string& id, const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        throw std::runtime_error("Servo '" + id + "' must be a mapping");
    }
    auto pin = node["pin"];
    if (!pin || !pin.IsScalar()) {
        throw std::runtime_error("Servo '" + id + "' is missing 'pin'");
    }

    ServoDescriptor d;
    d.id = id;
    d.name = node["name"] ? node["name"].as<std::string>(id) : id;
    try {
        d.pin = pin.as<int>();
        if (auto v = node["channel"]) d.channel = v.as<int>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Servo '" + id + "' has a non-integer pin or channel");
    }
    return d;
}

static HardwareConfig parse_hardware(const YAML::Node& node) {
    HardwareConfig cfg;
    if (!node || !node.IsMap()) return cfg;

    if (auto pwm = node["pwm"]; pwm && pwm.IsMap()) {
        if (auto v = pwm["backend"])           cfg.pwm_backend = v.as<std::string>(cfg.pwm_backend);
        if (auto v = pwm["sysfs_chip"])        cfg.sysfs_chip = v.as<std::string>(cfg.sysfs_chip);
        if (auto v = pwm["gpio_chip"])         cfg.gpio_chip = v.as<std::string>(cfg.gpio_chip);
        if (auto v = pwm["frequency"])         cfg.calibration.frequencyHz = v.as<double>();
        if (auto v = pwm["center_duty_cycle"]) cfg.calibration.center = v.as<double>();
        if (auto v = pwm["min_duty_cycle"])    cfg.calibration.min = v.as<double>();
        if (auto v = pwm["max_duty_cycle"])    cfg.calibration.max = v.as<double>();
    }
    if (cfg.pwm_backend != "sysfs" && cfg.pwm_backend != "gpiod") {
        throw std::runtime_error("hardware.pwm.backend must be 'sysfs' or 'gpiod'");
    }
    if (!cfg.calibration.valid()) {
        throw std::runtime_error("hardware.pwm calibration requires 0 < min < center < max < 1 and frequency > 0");
    }

    if (auto v = node["start_speed"]) cfg.start_speed = v.as<double>();
    check_range(cfg.start_speed, 0.0, 1.0, "hardware.start_speed");

    if (auto servos = node["servos"]; servos && servos.IsMap()) {
        for (const auto& kv : servos) {
            cfg.servos.push_back(parse_servo(kv.first.as<std::string>(), kv.second));
        }
    }
    return cfg;
}

static SafetyConfig parse_safety(const YAML::Node& node) {
    SafetyConfig cfg;
    if (!node || !node.IsMap()) return cfg;

    if (auto v = node["enabled"])                    cfg.enabled = v.as<bool>(cfg.enabled);
    if (auto v = node["emergency_stop_enabled"])     cfg.emergency_stop_enabled = v.as<bool>(cfg.emergency_stop_enabled);
    if (auto v = node["bounds_checking_enabled"])    cfg.bounds_checking_enabled = v.as<bool>(cfg.bounds_checking_enabled);
    if (auto v = node["speed_limiting_enabled"])     cfg.speed_limiting_enabled = v.as<bool>(cfg.speed_limiting_enabled);
    if (auto v = node["timeout_protection_enabled"]) cfg.timeout_protection_enabled = v.as<bool>(cfg.timeout_protection_enabled);

    if (auto v = node["command_timeout"])            cfg.command_timeout_ms = v.as<int>();
    if (auto v = node["movement_timeout"])           cfg.movement_timeout_ms = v.as<int>();
    if (auto v = node["emergency_stop_timeout"])     cfg.emergency_stop_timeout_ms = v.as<int>();
    if (auto v = node["global_max_speed"])           cfg.global_max_speed = v.as<int>();
    if (auto v = node["global_max_acceleration"])    cfg.global_max_acceleration = v.as<int>();

    if (auto v = node["power_monitoring_enabled"])   cfg.power_monitoring_enabled = v.as<bool>(cfg.power_monitoring_enabled);
    if (auto v = node["max_current_draw"])           cfg.max_current_draw = v.as<double>();
    if (auto v = node["voltage_monitoring_enabled"]) cfg.voltage_monitoring_enabled = v.as<bool>(cfg.voltage_monitoring_enabled);
    if (auto v = node["min_voltage"])                cfg.min_voltage = v.as<double>();

    check_range(cfg.command_timeout_ms, 100, 30000, "safety.command_timeout");
    check_range(cfg.movement_timeout_ms, 1000, 60000, "safety.movement_timeout");
    check_range(cfg.emergency_stop_timeout_ms, 50, 1000, "safety.emergency_stop_timeout");
    check_range(cfg.global_max_speed, 0, 100, "safety.global_max_speed");
    check_range(cfg.global_max_acceleration, 0, 100, "safety.global_max_acceleration");
    check_range(cfg.max_current_draw, 0.1, 10.0, "safety.max_current_draw");
    check_range(cfg.min_voltage, 3.0, 6.0, "safety.min_voltage");
    return cfg;
}

static ApiConfig parse_api(const YAML::Node& node) {
    ApiConfig cfg;
    if (!node || !node.IsMap()) return cfg;

    if (auto v = node["host"])    cfg.host = v.as<std::string>(cfg.host);
    if (auto v = node["port"])    cfg.port = v.as<int>();
    if (auto v = node["debug"])   cfg.debug = v.as<bool>(cfg.debug);
    if (auto v = node["workers"]) cfg.workers = v.as<int>();

    if (auto cors = node["cors"]; cors && cors.IsMap()) {
        if (auto v = cors["enabled"]) cfg.cors.enabled = v.as<bool>(cfg.cors.enabled);
        cfg.cors.allowed_origins = as_string_list(cors["allowed_origins"], cfg.cors.allowed_origins);
        cfg.cors.allowed_methods = as_string_list(cors["allowed_methods"], cfg.cors.allowed_methods);
        cfg.cors.allowed_headers = as_string_list(cors["allowed_headers"], cfg.cors.allowed_headers);
    }
    if (auto rl = node["rate_limiting"]; rl && rl.IsMap()) {
        if (auto v = rl["enabled"])             cfg.rate_limiting.enabled = v.as<bool>(cfg.rate_limiting.enabled);
        if (auto v = rl["requests_per_minute"]) cfg.rate_limiting.requests_per_minute = v.as<int>();
        if (auto v = rl["burst_limit"])         cfg.rate_limiting.burst_limit = v.as<int>();
    }
    if (auto auth = node["authentication"]; auth && auth.IsMap()) {
        if (auto v = auth["enabled"])          cfg.authentication.enabled = v.as<bool>(false);
        if (auto v = auth["api_key_required"]) cfg.authentication.api_key_required = v.as<bool>(false);
        if (auto v = auth["jwt_enabled"])      cfg.authentication.jwt_enabled = v.as<bool>(false);
    }

    check_range(cfg.port, 1024, 65535, "api.port");
    check_range(cfg.workers, 1, 64, "api.workers");
    check_range(cfg.rate_limiting.requests_per_minute, 1, 1000, "api.rate_limiting.requests_per_minute");
    check_range(cfg.rate_limiting.burst_limit, 1, 100, "api.rate_limiting.burst_limit");
    return cfg;
}

static LoggingConfig parse_logging(const YAML::Node& node) {
    LoggingConfig cfg;
    if (!node || !node.IsMap()) return cfg;

    if (auto v = node["level"])           cfg.level = v.as<std::string>(cfg.level);
    if (auto v = node["file_enabled"])    cfg.file_enabled = v.as<bool>(cfg.file_enabled);
    if (auto v = node["file_path"])       cfg.file_path = v.as<std::string>(cfg.file_path);
    if (auto v = node["max_file_size"])   cfg.max_file_size = parse_byte_size(v.as<std::string>());
    if (auto v = node["backup_count"])    cfg.backup_count = v.as<int>();
    if (auto v = node["console_enabled"]) cfg.console_enabled = v.as<bool>(cfg.console_enabled);

    check_range(cfg.backup_count, 1, 20, "logging.backup_count");
    static const std::set<std::string> levels{"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};
    if (!levels.count(cfg.level)) {
        throw std::runtime_error("logging.level must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL");
    }
    return cfg;
}

static AppConfig parse_root(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw std::runtime_error("Configuration file is empty or invalid");
    }

    AppConfig cfg;
    try {
        cfg.system = parse_system(root["system"]);
        cfg.hardware = parse_hardware(root["hardware"]);
        cfg.safety = parse_safety(root["safety"]);
        cfg.api = parse_api(root["api"]);
        cfg.logging = parse_logging(root["logging"]);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }
    return cfg;
}

AppConfig load_config_from_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to load YAML: ") + e.what());
    }
    return parse_root(root);
}

AppConfig load_config_from_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
    }
    return parse_root(root);
}
