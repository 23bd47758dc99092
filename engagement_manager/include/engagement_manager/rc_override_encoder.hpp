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
 * @file rc_override_encoder.hpp
 * @brief Deterministic mapping from calibrated joystick axes to RC override PWM.
 *
 * Channel layout follows the ArduPilot RC default:
 *   channel 1 = roll, channel 2 = pitch, channel 3 = throttle, channel 4 = yaw
 *
 * Roll/pitch/yaw are encoded from the deflection (sample - calibration), with
 * optional deadband and gain. Throttle is encoded from the raw slider reading.
 * Every value is clamped to [minPwm, maxPwm]. The encoder holds no state beyond its
 * configuration, so identical inputs always produce identical outputs.
 */

#pragma once

#include <engagement_manager/axis_calibration.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace engagement_manager
{

/// Number of RC channels driven by the joystick.
constexpr std::size_t kOverrideChannelCount = 4;

/**
 * @struct ChannelOverride
 * @brief Per-channel override value, or `std::nullopt` for "released".
 *
 * A released channel hands control back to the vehicle's own RC input.
 */
struct ChannelOverride
{
  // Index 0 holds channel 1; use channel() for 1-based access.
  std::array<std::optional<uint16_t>, kOverrideChannelCount> values{};

  /// Returns the value of 1-based `channel`, or nullopt when released/out of range.
  std::optional<uint16_t> channel(std::size_t channel) const;

  /// True when no channel carries an override.
  bool allReleased() const;

  /// Override with every channel released.
  static ChannelOverride released();

  bool operator==(const ChannelOverride & other) const {return values == other.values;}
  bool operator!=(const ChannelOverride & other) const {return !(*this == other);}
};

/**
 * @struct EncoderConfig
 * @brief Scaling constants, fixed for the lifetime of an encoder.
 */
struct EncoderConfig
{
  /// PWM emitted for zero deflection.
  uint16_t centerPwm{1500};
  /// PWM change per unit of (normalized) deflection.
  double spanPwm{500.0};
  uint16_t minPwm{1000};
  uint16_t maxPwm{2000};
  /// Deflection magnitude treated as zero (roll/pitch/yaw only).
  double deadband{0.0};
  /// Multiplier applied to roll/pitch/yaw deflection.
  double gain{1.0};

  /// Throws std::invalid_argument when the mapping is not usable.
  void validate() const;
};

/**
 * @class RcOverrideEncoder
 * @brief Pure function object producing ChannelOverride values.
 */
class RcOverrideEncoder
{
public:
  explicit RcOverrideEncoder(EncoderConfig config);

  /// Encodes all four channels for one tick.
  ChannelOverride encode(const AxisSample & sample, const AxisCalibration & calibration) const;

  /// Encodes a signed deflection (roll/pitch/yaw path).
  uint16_t encodeDeflection(double deflection) const;
  /// Encodes an absolute reading (throttle path).
  uint16_t encodeAbsolute(double value) const;

  const EncoderConfig & config() const {return config_;}

private:
  /// Deadband with rescaling so output stays continuous at the band edge.
  double applyDeadband(double deflection) const;
  uint16_t toPwm(double offset) const;

  EncoderConfig config_;
};

}  // namespace engagement_manager
