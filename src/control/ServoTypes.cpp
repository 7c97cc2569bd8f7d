#include "control/ServoTypes.hpp"

const char* to_string(Direction d) {
    return d == Direction::Forward ? "forward" : "backward";
}

const char* to_string(ServoFault f) {
    switch (f) {
        case ServoFault::None:                return "none";
        case ServoFault::OutOfRange:          return "out_of_range";
        case ServoFault::NotFound:            return "not_found";
        case ServoFault::EmergencyStopActive: return "emergency_stop_active";
        case ServoFault::HardwareFault:       return "hardware_fault";
        case ServoFault::Timeout:             return "timeout";
    }
    return "unknown";
}

const char* to_string(InitResult r) {
    switch (r) {
        case InitResult::Ok:                   return "ok";
        case InitResult::NoServosConfigured:   return "no_servos_configured";
        case InitResult::ConfigurationInvalid: return "configuration_invalid";
        case InitResult::HardwareFault:        return "hardware_fault";
    }
    return "unknown";
}

std::optional<Direction> parse_direction(const std::string& s) {
    if (s == "forward") return Direction::Forward;
    if (s == "backward") return Direction::Backward;
    return std::nullopt;
}
