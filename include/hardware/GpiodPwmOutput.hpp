#pragma once
#include "hardware/PwmOutput.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <gpiod.h>

/**
 * Software PWM on a single GPIO line using the libgpiod character-device
 * interface. Any header pin works, at the cost of one timing thread per servo
 * and some pulse jitter under load.
 */
class GpiodPwmOutput : public PwmOutput {
public:
    GpiodPwmOutput(const std::string& chipName, unsigned int lineOffset,
                   double frequencyHz, double initialDuty);
    ~GpiodPwmOutput() override;

    void setDutyCycle(double fraction) override;
    double dutyCycle() const override { return duty_.load(); }
    void close() override;

private:
    void pulseLoop();
    void setupGPIO();
    void cleanupGPIO();

    std::string chipName_;
    unsigned int lineOffset_;
    std::chrono::nanoseconds period_;

    gpiod_chip* chip_ = nullptr;
    gpiod_line* line_ = nullptr;

    std::thread pulseThread_;
    std::atomic<bool> running_{false};
    std::atomic<double> duty_{0.0};
};
