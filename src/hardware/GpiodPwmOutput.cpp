#include "hardware/GpiodPwmOutput.hpp"
#include "app/Log.hpp"
#include <cmath>
#include <stdexcept>
#include <system_error>

GpiodPwmOutput::GpiodPwmOutput(const std::string& chipName, unsigned int lineOffset,
                               double frequencyHz, double initialDuty)
    : chipName_(chipName), lineOffset_(lineOffset),
      period_(static_cast<long long>(std::llround(1e9 / frequencyHz))) {
    duty_ = initialDuty;
    setupGPIO();
    running_ = true;
    try {
        pulseThread_ = std::thread(&GpiodPwmOutput::pulseLoop, this);
    } catch (const std::system_error&) {
        running_ = false;
        cleanupGPIO();
        throw;
    }
    logDebug("pwm") << "gpiod line " << chipName_ << ":" << lineOffset_ << " pulsing";
}

GpiodPwmOutput::~GpiodPwmOutput() {
    close();
}

void GpiodPwmOutput::setDutyCycle(double fraction) {
    if (!running_) {
        throw std::runtime_error("[pwm] " + chipName_ + ":" + std::to_string(lineOffset_) + " is closed");
    }
    if (fraction < 0.0 || fraction > 1.0) {
        throw std::runtime_error("[pwm] duty cycle fraction out of range");
    }
    duty_ = fraction;
}

void GpiodPwmOutput::close() {
    if (running_.exchange(false)) {
        if (pulseThread_.joinable()) pulseThread_.join();
    }
    cleanupGPIO();
}

void GpiodPwmOutput::pulseLoop() {
    using clock = std::chrono::steady_clock;
    auto periodStart = clock::now();
    while (running_) {
        const auto high = std::chrono::duration_cast<std::chrono::nanoseconds>(period_ * duty_.load());
        if (high.count() > 0) {
            gpiod_line_set_value(line_, 1);
            std::this_thread::sleep_until(periodStart + high);
        }
        gpiod_line_set_value(line_, 0);
        periodStart += period_;
        std::this_thread::sleep_until(periodStart);
    }
    gpiod_line_set_value(line_, 0);
}

void GpiodPwmOutput::setupGPIO() {
    chip_ = gpiod_chip_open_by_name(chipName_.c_str());
    if (!chip_) {
        throw std::runtime_error("[pwm] Failed to open " + chipName_);
    }

    line_ = gpiod_chip_get_line(chip_, lineOffset_);
    if (!line_) {
        cleanupGPIO();
        throw std::runtime_error("[pwm] Failed to get line " + std::to_string(lineOffset_));
    }
    if (gpiod_line_request_output(line_, "servo_arm", 0) < 0) {
        line_ = nullptr;
        cleanupGPIO();
        throw std::runtime_error("[pwm] Failed to request line " + std::to_string(lineOffset_));
    }
}

void GpiodPwmOutput::cleanupGPIO() {
    if (line_) {
        gpiod_line_release(line_);
        line_ = nullptr;
    }
    if (chip_) {
        gpiod_chip_close(chip_);
        chip_ = nullptr;
    }
}
