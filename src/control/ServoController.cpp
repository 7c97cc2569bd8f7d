#include "control/ServoController.hpp"
#include "app/Log.hpp"
#include "control/DutyCycle.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

void set_fault(ServoFault* out, ServoFault f) {
    if (out) *out = f;
}

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since).count();
}

}  // namespace

ServoController::ServoController(HardwareConfig hardware, SafetyConfig safety, PwmOutputFactory factory)
    : hardware_(std::move(hardware)), safety_(std::move(safety)), factory_(std::move(factory)) {
    logInfo("Servo") << "Servo controller created, " << hardware_.servos.size() << " servo(s) configured";
}

ServoController::~ServoController() {
    cleanup();
}

InitResult ServoController::initialize() {
    std::lock_guard<std::mutex> lk(mtx_);
    registry_.clear();

    if (hardware_.servos.empty()) {
        logWarn("Servo") << "No servos configured";
        return InitResult::NoServosConfigured;
    }

    std::set<std::string> ids;
    std::set<int> outputs;
    for (const auto& servo : hardware_.servos) {
        if (servo.id.empty() || servo.pin < 0) {
            logError("Servo") << "Servo '" << servo.id << "' has an invalid pin " << servo.pin;
            return InitResult::ConfigurationInvalid;
        }
        const int output = servo.channel >= 0 ? servo.channel : servo.pin;
        if (!ids.insert(servo.id).second || !outputs.insert(output).second) {
            logError("Servo") << "Servo '" << servo.id << "' duplicates another servo's id or output";
            return InitResult::ConfigurationInvalid;
        }
    }

    // Outputs acquired so far are released by unique_ptr if a later one fails.
    std::vector<std::pair<ServoDescriptor, std::unique_ptr<PwmOutput>>> acquired;
    for (const auto& servo : hardware_.servos) {
        try {
            auto output = factory_(servo, hardware_.calibration, hardware_.calibration.center);
            if (!output) {
                throw std::runtime_error("backend returned no output");
            }
            acquired.emplace_back(servo, std::move(output));
            logInfo("Servo") << "Initialized servo " << servo.id << " on pin " << servo.pin;
        } catch (const std::exception& e) {
            logError("Servo") << "Failed to initialize servo " << servo.id << ": " << e.what();
            for (auto& [desc, output] : acquired) {
                try {
                    output->close();
                } catch (const std::exception& ce) {
                    logWarn("Servo") << "Failed to release " << desc.id << ": " << ce.what();
                }
            }
            return InitResult::HardwareFault;
        }
    }

    for (auto& [desc, output] : acquired) {
        registry_.registerServo(desc.id, desc, std::move(output));
    }
    logInfo("Servo") << "Successfully initialized " << registry_.size() << " servos";
    return InitResult::Ok;
}

bool ServoController::setSpeed(const std::string& id, double speed, ServoFault* fault,
                               double* applied) {
    std::lock_guard<std::mutex> lk(mtx_);
    return setSpeedLocked(id, speed, fault, applied);
}

bool ServoController::start(const std::string& id, Direction direction, ServoFault* fault) {
    const double speed = direction == Direction::Forward ? hardware_.start_speed : -hardware_.start_speed;
    std::lock_guard<std::mutex> lk(mtx_);
    return setSpeedLocked(id, speed, fault);
}

bool ServoController::stop(const std::string& id, ServoFault* fault) {
    std::lock_guard<std::mutex> lk(mtx_);
    return setSpeedLocked(id, 0.0, fault);
}

bool ServoController::stopAll() {
    std::lock_guard<std::mutex> lk(mtx_);
    return stopAllLocked();
}

bool ServoController::emergencyStop() {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto begin = std::chrono::steady_clock::now();
    emergencyStopActive_ = true;
    logWarn("Servo") << "Emergency stop activated";

    const bool ok = stopAllLocked();

    const auto took = elapsed_ms(begin);
    if (safety_.enabled && took > safety_.emergency_stop_timeout_ms) {
        logError("Servo") << "Emergency stop took " << took << "ms, limit is "
                          << safety_.emergency_stop_timeout_ms << "ms";
    }
    if (!ok) {
        logCritical("Servo") << "Emergency stop could not stop every servo";
    }
    return ok;
}

bool ServoController::clearEmergencyStop() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (emergencyStopActive_) {
        logInfo("Servo") << "Emergency stop cleared";
    }
    emergencyStopActive_ = false;
    return true;
}

bool ServoController::isEmergencyStopActive() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return emergencyStopActive_;
}

std::optional<ServoStatus> ServoController::status(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto* entry = registry_.find(id);
    if (!entry) return std::nullopt;
    return snapshot(entry->state);
}

std::map<std::string, ServoStatus> ServoController::statusAll() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::map<std::string, ServoStatus> out;
    for (const auto& id : registry_.ids()) {
        out.emplace(id, snapshot(registry_.find(id)->state));
    }
    return out;
}

std::size_t ServoController::servoCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return registry_.size();
}

void ServoController::cleanup() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (registry_.empty()) return;
    stopAllLocked();
    registry_.clear();
    logInfo("Servo") << "Servo outputs released";
}

bool ServoController::setSpeedLocked(const std::string& id, double speed, ServoFault* fault,
                                     double* appliedOut) {
    set_fault(fault, ServoFault::None);

    if (emergencyStopActive_ && speed != 0.0) {
        logWarn("Servo") << "Cannot set speed - emergency stop active";
        set_fault(fault, ServoFault::EmergencyStopActive);
        return false;
    }

    auto* entry = registry_.find(id);
    if (!entry) {
        logError("Servo") << "Servo " << id << " not found";
        set_fault(fault, ServoFault::NotFound);
        return false;
    }

    double applied = 0.0;
    double duty = 0.0;
    try {
        speed_to_duty(speed, hardware_.calibration);  // range check before limiting
        applied = applySpeedLimit(speed);
        duty = speed_to_duty(applied, hardware_.calibration);
    } catch (const std::out_of_range& e) {
        logError("Servo") << "Rejected speed for servo " << id << ": " << e.what();
        set_fault(fault, ServoFault::OutOfRange);
        return false;
    }

    const auto begin = std::chrono::steady_clock::now();
    try {
        entry->output->setDutyCycle(duty);
    } catch (const std::exception& e) {
        logError("Servo") << "Failed to set servo " << id << " speed: " << e.what();
        set_fault(fault, ServoFault::HardwareFault);
        return false;
    }
    const auto took = elapsed_ms(begin);
    if (appliedOut) *appliedOut = applied;

    auto& state = entry->state;
    const bool wasRunning = state.isRunning;
    const bool reversed = wasRunning && ((state.speed > 0.0) != (applied > 0.0));
    state.speed = applied;
    state.isRunning = applied != 0.0;
    if (state.isRunning && (!wasRunning || reversed)) {
        state.startedAt = begin;
    }

    logInfo("Servo") << "Set servo " << id << " speed to " << std::fixed << std::setprecision(2) << applied;

    if (safety_.enabled && safety_.timeout_protection_enabled && took > safety_.command_timeout_ms) {
        logError("Servo") << "Servo " << id << " write took " << took << "ms, limit is "
                          << safety_.command_timeout_ms << "ms";
        set_fault(fault, ServoFault::Timeout);
        return false;
    }
    return true;
}

bool ServoController::stopAllLocked() {
    bool success = true;
    for (const auto& id : registry_.ids()) {
        if (!setSpeedLocked(id, 0.0, nullptr)) success = false;
    }
    return success;
}

double ServoController::applySpeedLimit(double speed) const {
    if (!safety_.enabled || !safety_.speed_limiting_enabled || speed == 0.0) return speed;
    const double limit = safety_.global_max_speed / 100.0;
    const double clamped = std::clamp(speed, -limit, limit);
    if (clamped != speed) {
        logDebug("Servo") << "Speed " << speed << " limited to " << clamped;
    }
    return clamped;
}

ServoStatus ServoController::snapshot(const ServoState& state) const {
    ServoStatus s;
    s.speed = state.speed;
    s.isRunning = state.isRunning;
    if (state.isRunning) {
        s.direction = state.speed > 0.0 ? Direction::Forward : Direction::Backward;
        s.runtimeSec = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.startedAt).count();
    }
    return s;
}
