#pragma once
#include "hardware/PwmOutput.hpp"
#include <cstdint>
#include <string>

/**
 * Hardware PWM channel through the sysfs interface
 * (/sys/class/pwm/pwmchipN/pwmM). The channel is exported and enabled on
 * construction, disabled and unexported on close().
 */
class SysfsPwmOutput : public PwmOutput {
public:
    SysfsPwmOutput(const std::string& chipPath, unsigned int channel,
                   double frequencyHz, double initialDuty);
    ~SysfsPwmOutput() override;

    void setDutyCycle(double fraction) override;
    double dutyCycle() const override { return duty_; }
    void close() override;

private:
    void setupPWM(double initialDuty);
    void teardownPWM();
    void writeFile(const std::string& path, const std::string& value);

    const std::string chipPath_;
    const unsigned int channel_;
    std::string pwmPath_;

    uint64_t periodNs_;
    double duty_ = 0.0;
    bool open_ = false;
};
