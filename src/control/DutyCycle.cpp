#include "control/DutyCycle.hpp"
#include <stdexcept>
#include <string>

bool PwmCalibration::valid() const {
    return frequencyHz > 0.0 && min > 0.0 && min < center && center < max && max < 1.0;
}

double speed_to_duty(double speed, const PwmCalibration& cal) {
    if (!(speed >= -1.0 && speed <= 1.0)) {
        throw std::out_of_range("Speed must be between -1.0 and 1.0, got " + std::to_string(speed));
    }

    if (speed == 0.0) return cal.center;
    if (speed > 0.0) {
        return cal.center + speed * (cal.max - cal.center);
    }
    return cal.center + speed * (cal.center - cal.min);
}

double duty_to_speed(double duty, const PwmCalibration& cal) {
    if (!(duty >= cal.min && duty <= cal.max)) {
        throw std::out_of_range("Duty cycle must be between " + std::to_string(cal.min) +
                                " and " + std::to_string(cal.max));
    }

    if (duty == cal.center) return 0.0;
    if (duty > cal.center) {
        return (duty - cal.center) / (cal.max - cal.center);
    }
    return (duty - cal.center) / (cal.center - cal.min);
}
