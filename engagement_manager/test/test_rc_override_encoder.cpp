/**
 * @note C++ Primer for Python ROS2 readers
 *
 * This file follows a few recurring C++ patterns:
 * - Ownership is explicit: `std::unique_ptr` means single owner, `std::shared_ptr` means shared ownership.
 * - References (`T&`) and `const` are used to avoid unnecessary copies and make mutation intent explicit.
 * - RAII is used for resource safety: objects such as locks clean themselves up automatically at scope exit.
 * - ROS2 callbacks may run concurrently depending on executor/callback-group setup, so shared state is guarded.
 * - Templates (for example `create_subscription<MsgT>`) are compile-time type binding, not runtime reflection.
 */
/**
 * @file test_rc_override_encoder.cpp
 * @brief Unit tests for axis-to-PWM encoding and encoder configuration checks.
 */

#include <gtest/gtest.h>

#include <engagement_manager/rc_override_encoder.hpp>

#include <limits>
#include <stdexcept>

namespace
{

engagement_manager::AxisSample sample(double roll, double pitch, double yaw, double throttle)
{
  engagement_manager::AxisSample s;
  s.roll = roll;
  s.pitch = pitch;
  s.yaw = yaw;
  s.throttle = throttle;
  return s;
}

}  // namespace

// Centered sticks map to center PWM on roll/pitch/yaw; throttle stays absolute.
TEST(RcOverrideEncoderTest, NeutralDeflectionEncodesCenter)
{
  engagement_manager::RcOverrideEncoder encoder{engagement_manager::EncoderConfig{}};
  const auto calibration = engagement_manager::AxisCalibration::capture(sample(0.2, -0.1, 0.05, 0.0));

  const auto out = encoder.encode(sample(0.2, -0.1, 0.05, 0.5), calibration);
  EXPECT_EQ(out.channel(1), 1500);
  EXPECT_EQ(out.channel(2), 1500);
  EXPECT_EQ(out.channel(3), 1750);
  EXPECT_EQ(out.channel(4), 1500);
  EXPECT_FALSE(out.allReleased());
}

// A 0.30 calibration with a 0.32 reading is a +0.02 deflection: 1500 + 10.
TEST(RcOverrideEncoderTest, SmallDeflectionFromCalibration)
{
  engagement_manager::RcOverrideEncoder encoder{engagement_manager::EncoderConfig{}};
  const auto calibration = engagement_manager::AxisCalibration::capture(sample(0.30, 0.0, 0.0, 0.0));

  const auto out = encoder.encode(sample(0.32, 0.0, 0.0, 0.0), calibration);
  EXPECT_EQ(out.channel(1), 1510);
}

TEST(RcOverrideEncoderTest, ClampsToPwmLimits)
{
  engagement_manager::RcOverrideEncoder encoder{engagement_manager::EncoderConfig{}};
  const auto calibration = engagement_manager::AxisCalibration::capture(sample(-0.9, 0.9, 0.0, 0.0));

  const auto out = encoder.encode(sample(0.9, -0.9, 1.0, -1.0), calibration);
  EXPECT_EQ(out.channel(1), 2000);
  EXPECT_EQ(out.channel(2), 1000);
  EXPECT_EQ(out.channel(3), 1000);
  EXPECT_EQ(out.channel(4), 2000);
}

TEST(RcOverrideEncoderTest, SymmetricAroundCenter)
{
  engagement_manager::RcOverrideEncoder encoder{engagement_manager::EncoderConfig{}};
  for (const double d : {0.001, 0.013, 0.25, 0.5, 0.77}) {
    const int up = encoder.encodeDeflection(d) - 1500;
    const int down = 1500 - encoder.encodeDeflection(-d);
    EXPECT_EQ(up, down) << "deflection " << d;
  }
}

TEST(RcOverrideEncoderTest, NonFiniteInputEncodesCenter)
{
  engagement_manager::RcOverrideEncoder encoder{engagement_manager::EncoderConfig{}};
  EXPECT_EQ(encoder.encodeDeflection(std::numeric_limits<double>::quiet_NaN()), 1500);
  EXPECT_EQ(encoder.encodeDeflection(std::numeric_limits<double>::infinity()), 1500);
  EXPECT_EQ(encoder.encodeAbsolute(std::numeric_limits<double>::quiet_NaN()), 1500);
}

// Deadband suppresses small deflections and rescales the remainder so the
// output is continuous at the band edge.
TEST(RcOverrideEncoderTest, DeadbandSuppressesAndRescales)
{
  engagement_manager::EncoderConfig config;
  config.deadband = 0.1;
  engagement_manager::RcOverrideEncoder encoder{config};

  EXPECT_EQ(encoder.encodeDeflection(0.05), 1500);
  EXPECT_EQ(encoder.encodeDeflection(-0.1), 1500);
  EXPECT_EQ(encoder.encodeDeflection(0.55), 1750);
  EXPECT_EQ(encoder.encodeDeflection(-0.55), 1250);
  EXPECT_EQ(encoder.encodeDeflection(1.0), 2000);
}

TEST(RcOverrideEncoderTest, GainScalesDeflectionOnly)
{
  engagement_manager::EncoderConfig config;
  config.gain = 0.5;
  engagement_manager::RcOverrideEncoder encoder{config};

  EXPECT_EQ(encoder.encodeDeflection(0.4), 1600);
  EXPECT_EQ(encoder.encodeAbsolute(0.4), 1700);
}

TEST(RcOverrideEncoderTest, DeterministicForIdenticalInputs)
{
  engagement_manager::RcOverrideEncoder encoder{engagement_manager::EncoderConfig{}};
  const auto calibration = engagement_manager::AxisCalibration::capture(sample(0.1, 0.2, 0.3, 0.0));
  const auto s = sample(0.17, -0.42, 0.61, 0.33);
  EXPECT_EQ(encoder.encode(s, calibration), encoder.encode(s, calibration));
}

TEST(RcOverrideEncoderTest, ReleasedOverrideHasNoValues)
{
  const auto released = engagement_manager::ChannelOverride::released();
  EXPECT_TRUE(released.allReleased());
  for (std::size_t ch = 1; ch <= engagement_manager::kOverrideChannelCount; ++ch) {
    EXPECT_FALSE(released.channel(ch).has_value());
  }
  EXPECT_FALSE(released.channel(0).has_value());
  EXPECT_FALSE(released.channel(5).has_value());
}

TEST(RcOverrideEncoderTest, RejectsInvalidConfig)
{
  engagement_manager::EncoderConfig inverted;
  inverted.minPwm = 2000;
  inverted.maxPwm = 1000;
  EXPECT_THROW(engagement_manager::RcOverrideEncoder{inverted}, std::invalid_argument);

  engagement_manager::EncoderConfig offCenter;
  offCenter.centerPwm = 2100;
  EXPECT_THROW(engagement_manager::RcOverrideEncoder{offCenter}, std::invalid_argument);

  engagement_manager::EncoderConfig zeroFloor;
  zeroFloor.minPwm = 0;
  EXPECT_THROW(engagement_manager::RcOverrideEncoder{zeroFloor}, std::invalid_argument);

  engagement_manager::EncoderConfig badDeadband;
  badDeadband.deadband = 1.0;
  EXPECT_THROW(engagement_manager::RcOverrideEncoder{badDeadband}, std::invalid_argument);

  engagement_manager::EncoderConfig badGain;
  badGain.gain = 0.0;
  EXPECT_THROW(engagement_manager::RcOverrideEncoder{badGain}, std::invalid_argument);
}
