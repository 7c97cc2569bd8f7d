#pragma once
#include <chrono>
#include <optional>
#include <string>

enum class Direction { Forward, Backward };

// Read-only after configuration load.
struct ServoDescriptor {
    std::string id;
    std::string name;
    int pin = -1;          // BCM line offset for gpiod, unused for sysfs
    int channel = -1;      // sysfs PWM channel; -1 → use pin
};

// Mutated only by ServoController while holding its lock.
struct ServoState {
    double speed = 0.0;    // -1.0 .. 1.0
    bool isRunning = false;
    std::chrono::steady_clock::time_point startedAt{};
};

struct ServoStatus {
    double speed = 0.0;
    bool isRunning = false;
    std::optional<Direction> direction;
    double runtimeSec = 0.0;
};

enum class ServoFault {
    None,
    OutOfRange,
    NotFound,
    EmergencyStopActive,
    HardwareFault,
    Timeout,
};

enum class InitResult {
    Ok,
    NoServosConfigured,
    ConfigurationInvalid,
    HardwareFault,
};

const char* to_string(Direction d);
const char* to_string(ServoFault f);
const char* to_string(InitResult r);

// Accepts "forward" / "backward"; empty optional otherwise.
std::optional<Direction> parse_direction(const std::string& s);
