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
 * @file axis_calibration.hpp
 * @brief Joystick axis snapshot and the neutral reference captured at engagement.
 *
 * Axis readings are normalized to [-1, 1] by the joystick driver (sensor_msgs/Joy
 * convention). The calibration records roll/pitch/yaw at the moment the trigger is
 * pressed; subsequent readings are interpreted as deflections from that point.
 * Throttle is absolute and is never zeroed, so it has no calibration slot.
 */

#pragma once

namespace engagement_manager
{

/**
 * @struct AxisSample
 * @brief One immutable poll of the four control axes.
 */
struct AxisSample
{
  double roll{0.0};
  double pitch{0.0};
  double yaw{0.0};
  /// Slider position, used as-is for the throttle channel.
  double throttle{0.0};
};

/**
 * @struct AxisCalibration
 * @brief Neutral reference for roll/pitch/yaw held for the life of one engagement.
 */
struct AxisCalibration
{
  double roll{0.0};
  double pitch{0.0};
  double yaw{0.0};

  /// Records the roll/pitch/yaw of `sample` as the new zero.
  static AxisCalibration capture(const AxisSample & sample)
  {
    return AxisCalibration{sample.roll, sample.pitch, sample.yaw};
  }
};

}  // namespace engagement_manager
