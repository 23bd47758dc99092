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
#include <engagement_manager/rc_override_encoder.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace engagement_manager
{

std::optional<uint16_t> ChannelOverride::channel(const std::size_t channel) const
{
  if (channel < 1 || channel > kOverrideChannelCount) {
    return std::nullopt;
  }
  return values[channel - 1];
}

bool ChannelOverride::allReleased() const
{
  return std::none_of(
    values.begin(), values.end(),
    [](const std::optional<uint16_t> & value) {return value.has_value();});
}

ChannelOverride ChannelOverride::released()
{
  return ChannelOverride{};
}

void EncoderConfig::validate() const
{
  if (minPwm >= maxPwm) {
    throw std::invalid_argument("override.min_pwm must be below override.max_pwm");
  }
  if (centerPwm < minPwm || centerPwm > maxPwm) {
    throw std::invalid_argument(
            "override.center_pwm " + std::to_string(centerPwm) + " outside [min_pwm, max_pwm]");
  }
  // Zero is the "release" sentinel on the wire, so it can never be a real output.
  if (minPwm == 0) {
    throw std::invalid_argument("override.min_pwm must be > 0");
  }
  if (!(spanPwm > 0.0) || !std::isfinite(spanPwm)) {
    throw std::invalid_argument("override.span_pwm must be a positive number");
  }
  if (!(gain > 0.0) || !std::isfinite(gain)) {
    throw std::invalid_argument("override.gain must be a positive number");
  }
  if (!(deadband >= 0.0) || deadband >= 1.0) {
    throw std::invalid_argument("override.deadband must be in [0, 1)");
  }
}

RcOverrideEncoder::RcOverrideEncoder(EncoderConfig config)
: config_(config)
{
  config_.validate();
}

ChannelOverride RcOverrideEncoder::encode(
  const AxisSample & sample,
  const AxisCalibration & calibration) const
{
  ChannelOverride out;
  out.values[0] = encodeDeflection(sample.roll - calibration.roll);
  out.values[1] = encodeDeflection(sample.pitch - calibration.pitch);
  out.values[2] = encodeAbsolute(sample.throttle);
  out.values[3] = encodeDeflection(sample.yaw - calibration.yaw);
  return out;
}

uint16_t RcOverrideEncoder::encodeDeflection(const double deflection) const
{
  return toPwm(config_.gain * config_.spanPwm * applyDeadband(deflection));
}

uint16_t RcOverrideEncoder::encodeAbsolute(const double value) const
{
  return toPwm(config_.spanPwm * value);
}

double RcOverrideEncoder::applyDeadband(const double deflection) const
{
  if (!std::isfinite(deflection)) {
    return 0.0;
  }
  const double magnitude = std::fabs(deflection);
  if (magnitude <= config_.deadband) {
    return 0.0;
  }
  const double scaled = (magnitude - config_.deadband) / (1.0 - config_.deadband);
  return std::copysign(scaled, deflection);
}

uint16_t RcOverrideEncoder::toPwm(const double offset) const
{
  if (!std::isfinite(offset)) {
    return config_.centerPwm;
  }
  // std::lround is odd-symmetric, so +d and -d land equally far from center.
  const double limited = std::clamp(offset, -65535.0, 65535.0);
  const double bounded = std::clamp(
    static_cast<double>(config_.centerPwm) + static_cast<double>(std::lround(limited)),
    static_cast<double>(config_.minPwm), static_cast<double>(config_.maxPwm));
  return static_cast<uint16_t>(bounded);
}

}  // namespace engagement_manager
