#include "hardware/PwmOutput.hpp"
#include "app/Config.hpp"
#include "hardware/GpiodPwmOutput.hpp"
#include "hardware/SysfsPwmOutput.hpp"
#include <stdexcept>

PwmOutputFactory make_pwm_output_factory(const HardwareConfig& cfg) {
    if (cfg.pwm_backend == "gpiod") {
        const std::string chip = cfg.gpio_chip;
        return [chip](const ServoDescriptor& servo, const PwmCalibration& cal, double initialDuty)
                   -> std::unique_ptr<PwmOutput> {
            return std::make_unique<GpiodPwmOutput>(chip, static_cast<unsigned int>(servo.pin),
                                                    cal.frequencyHz, initialDuty);
        };
    }
    if (cfg.pwm_backend == "sysfs") {
        const std::string chip = cfg.sysfs_chip;
        return [chip](const ServoDescriptor& servo, const PwmCalibration& cal, double initialDuty)
                   -> std::unique_ptr<PwmOutput> {
            const int channel = servo.channel >= 0 ? servo.channel : servo.pin;
            return std::make_unique<SysfsPwmOutput>(chip, static_cast<unsigned int>(channel),
                                                    cal.frequencyHz, initialDuty);
        };
    }
    throw std::runtime_error("Unknown PWM backend: " + cfg.pwm_backend);
}
