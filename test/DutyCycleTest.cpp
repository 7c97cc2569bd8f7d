#include "control/DutyCycle.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

namespace {

const PwmCalibration kCal{};  // 50 Hz, 0.0696 / 0.05 / 0.10

TEST(DutyCycleTest, BoundariesMapToCalibration) {
    EXPECT_DOUBLE_EQ(speed_to_duty(0.0, kCal), kCal.center);
    EXPECT_DOUBLE_EQ(speed_to_duty(1.0, kCal), kCal.max);
    EXPECT_DOUBLE_EQ(speed_to_duty(-1.0, kCal), kCal.min);
}

TEST(DutyCycleTest, InterpolatesEachSideOfCenterSeparately) {
    EXPECT_NEAR(speed_to_duty(0.5, kCal), 0.0696 + 0.5 * (0.10 - 0.0696), 1e-12);
    EXPECT_NEAR(speed_to_duty(-0.5, kCal), 0.0696 - 0.5 * (0.0696 - 0.05), 1e-12);
}

TEST(DutyCycleTest, RejectsSpeedOutsideUnitRange) {
    EXPECT_THROW(speed_to_duty(1.5, kCal), std::out_of_range);
    EXPECT_THROW(speed_to_duty(-1.0001, kCal), std::out_of_range);
    EXPECT_THROW(speed_to_duty(std::numeric_limits<double>::quiet_NaN(), kCal), std::out_of_range);
}

TEST(DutyCycleTest, RejectsDutyOutsideCalibration) {
    EXPECT_THROW(duty_to_speed(0.049, kCal), std::out_of_range);
    EXPECT_THROW(duty_to_speed(0.11, kCal), std::out_of_range);
}

TEST(DutyCycleTest, CenterDutyIsExactlyZeroSpeed) {
    EXPECT_EQ(duty_to_speed(kCal.center, kCal), 0.0);
    EXPECT_DOUBLE_EQ(duty_to_speed(kCal.max, kCal), 1.0);
    EXPECT_DOUBLE_EQ(duty_to_speed(kCal.min, kCal), -1.0);
}

TEST(DutyCycleTest, MonotonicAndBounded) {
    double prev = speed_to_duty(-1.0, kCal);
    for (int i = -100; i <= 100; ++i) {
        const double duty = speed_to_duty(i / 100.0, kCal);
        EXPECT_GE(duty, prev);
        EXPECT_GE(duty, kCal.min);
        EXPECT_LE(duty, kCal.max);
        prev = duty;
    }
}

TEST(DutyCycleTest, InverseRecoversSpeed) {
    for (int i = -1000; i <= 1000; i += 7) {
        const double s = i / 1000.0;
        EXPECT_NEAR(duty_to_speed(speed_to_duty(s, kCal), kCal), s, 1e-9);
    }
}

TEST(DutyCycleTest, CustomCalibrationIsHonoured) {
    PwmCalibration cal;
    cal.center = 0.075;
    cal.min = 0.05;
    cal.max = 0.10;
    ASSERT_TRUE(cal.valid());
    EXPECT_DOUBLE_EQ(speed_to_duty(0.5, cal), 0.0875);
    EXPECT_DOUBLE_EQ(speed_to_duty(-0.5, cal), 0.0625);
}

TEST(DutyCycleTest, CalibrationValidity) {
    PwmCalibration cal;
    EXPECT_TRUE(cal.valid());
    cal.center = 0.2;
    EXPECT_FALSE(cal.valid());
    cal = PwmCalibration{};
    cal.frequencyHz = 0.0;
    EXPECT_FALSE(cal.valid());
}

}  // namespace
