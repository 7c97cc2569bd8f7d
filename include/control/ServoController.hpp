#pragma once
#include "app/Config.hpp"
#include "control/ServoRegistry.hpp"
#include "hardware/PwmOutput.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

/**
 * Sole owner of the servo outputs and the emergency-stop interlock.
 *
 * Every public call holds one mutex for its whole duration, so an emergency
 * stop can never interleave with a speed change on another thread. Hardware
 * faults are caught and logged here and come back as false / a non-Ok result;
 * nothing thrown by a PWM back-end escapes this class.
 *
 * Speeds are -1.0 (full counter-clockwise) .. 1.0 (full clockwise).
 */
class ServoController {
public:
    ServoController(HardwareConfig hardware, SafetyConfig safety, PwmOutputFactory factory);
    ~ServoController();

    ServoController(const ServoController&) = delete;
    ServoController& operator=(const ServoController&) = delete;

    // Drops any current outputs and opens one per configured servo at the
    // center duty cycle. All-or-nothing: on failure the registry is empty.
    InitResult initialize();

    // Non-zero speeds are refused while the emergency stop is engaged; zero is
    // always allowed. `fault`, if given, receives the reason for a false result;
    // `applied`, if given, receives the speed actually written after limiting.
    bool setSpeed(const std::string& id, double speed, ServoFault* fault = nullptr,
                  double* applied = nullptr);
    bool start(const std::string& id, Direction direction, ServoFault* fault = nullptr);
    bool stop(const std::string& id, ServoFault* fault = nullptr);
    bool stopAll();

    // Engages the interlock, then stops every servo. Returns the stop-all result.
    bool emergencyStop();
    bool clearEmergencyStop();
    bool isEmergencyStopActive() const;

    std::optional<ServoStatus> status(const std::string& id) const;
    std::map<std::string, ServoStatus> statusAll() const;
    std::size_t servoCount() const;

    // Stops everything and releases all outputs.
    void cleanup();

private:
    bool setSpeedLocked(const std::string& id, double speed, ServoFault* fault,
                        double* appliedOut = nullptr);
    bool stopAllLocked();
    double applySpeedLimit(double speed) const;
    ServoStatus snapshot(const ServoState& state) const;

    const HardwareConfig hardware_;
    const SafetyConfig safety_;
    PwmOutputFactory factory_;

    mutable std::mutex mtx_;
    ServoRegistry registry_;
    bool emergencyStopActive_ = false;
};
