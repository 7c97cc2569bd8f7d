#pragma once

/**
 * PWM calibration for a continuous-rotation servo.
 *
 * Duty cycles are fractions of the PWM period (0.05 == 1.0 ms at 50 Hz).
 *   min    → full speed counter-clockwise
 *   center → stopped (empirically determined, not exactly 1.5 ms)
 *   max    → full speed clockwise
 */
struct PwmCalibration {
    double frequencyHz = 50.0;
    double center = 0.0696;   // ~1.392 ms pulse
    double min = 0.05;        // 1.0 ms pulse
    double max = 0.10;        // 2.0 ms pulse

    bool valid() const;
};

// Throws std::out_of_range if speed is outside [-1.0, 1.0].
double speed_to_duty(double speed, const PwmCalibration& cal);

// Throws std::out_of_range if duty is outside [cal.min, cal.max].
double duty_to_speed(double duty, const PwmCalibration& cal);
