#pragma once
#include "control/DutyCycle.hpp"
#include "control/ServoTypes.hpp"
#include <functional>
#include <memory>

/**
 * One PWM-driven output line, exclusively owned by whoever holds the pointer.
 *
 * Implementations acquire the hardware in their constructor (throwing
 * std::runtime_error on failure) and release it in close() / the destructor.
 * close() must be safe to call more than once.
 */
class PwmOutput {
public:
    virtual ~PwmOutput() = default;

    // fraction of the period, 0.0 .. 1.0. Throws std::runtime_error on I/O failure.
    virtual void setDutyCycle(double fraction) = 0;
    virtual double dutyCycle() const = 0;
    virtual void close() = 0;
};

using PwmOutputFactory = std::function<std::unique_ptr<PwmOutput>(
    const ServoDescriptor& servo, const PwmCalibration& cal, double initialDuty)>;

struct HardwareConfig;

// Builds the factory for hardware.pwm.backend ("sysfs" or "gpiod").
PwmOutputFactory make_pwm_output_factory(const HardwareConfig& cfg);
