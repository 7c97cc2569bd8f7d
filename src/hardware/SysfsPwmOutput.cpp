#include "hardware/SysfsPwmOutput.hpp"
#include "app/Log.hpp"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

SysfsPwmOutput::SysfsPwmOutput(const std::string& chipPath, unsigned int channel,
                               double frequencyHz, double initialDuty)
    : chipPath_(chipPath), channel_(channel),
      periodNs_(static_cast<uint64_t>(std::llround(1e9 / frequencyHz))) {
    pwmPath_ = chipPath_ + "/pwm" + std::to_string(channel_);
    try {
        setupPWM(initialDuty);
    } catch (...) {
        teardownPWM();
        throw;
    }
    open_ = true;
    logDebug("pwm") << "sysfs channel " << pwmPath_ << " enabled, period " << periodNs_ << "ns";
}

SysfsPwmOutput::~SysfsPwmOutput() {
    close();
}

void SysfsPwmOutput::setDutyCycle(double fraction) {
    if (!open_) {
        throw std::runtime_error("[pwm] " + pwmPath_ + " is closed");
    }
    const auto dutyNs = static_cast<uint64_t>(std::llround(fraction * static_cast<double>(periodNs_)));
    writeFile(pwmPath_ + "/duty_cycle", std::to_string(dutyNs));
    duty_ = fraction;
}

void SysfsPwmOutput::close() {
    if (!open_) return;
    open_ = false;
    teardownPWM();
}

void SysfsPwmOutput::setupPWM(double initialDuty) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(pwmPath_, ec)) {
        writeFile(chipPath_ + "/export", std::to_string(channel_));
        // udev needs a moment to fix permissions on the new node
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    // duty_cycle must never exceed period, so clear it before changing period
    writeFile(pwmPath_ + "/duty_cycle", "0");
    writeFile(pwmPath_ + "/period", std::to_string(periodNs_));
    const auto dutyNs = static_cast<uint64_t>(std::llround(initialDuty * static_cast<double>(periodNs_)));
    writeFile(pwmPath_ + "/duty_cycle", std::to_string(dutyNs));
    writeFile(pwmPath_ + "/enable", "1");
    duty_ = initialDuty;
}

void SysfsPwmOutput::teardownPWM() {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::exists(pwmPath_ + "/enable", ec)) {
        try {
            writeFile(pwmPath_ + "/enable", "0");
        } catch (const std::exception& e) {
            logWarn("pwm") << e.what();
        }
    }
    if (fs::exists(pwmPath_, ec) && fs::exists(chipPath_ + "/unexport", ec)) {
        try {
            writeFile(chipPath_ + "/unexport", std::to_string(channel_));
        } catch (const std::exception& e) {
            logWarn("pwm") << e.what();
        }
    }
}

void SysfsPwmOutput::writeFile(const std::string& path, const std::string& value) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("[pwm] Failed to open " + path);
    }
    file << value;
    file.flush();
    if (!file) {
        throw std::runtime_error("[pwm] Failed to write " + path);
    }
}
