#pragma once

#include <engagement_manager/engagement_controller.hpp>

#include <joylink/msg/rc_override.hpp>
#include <joylink/srv/arm.hpp>
#include <joylink/srv/set_mode.hpp>
#include <rclcpp/rclcpp.hpp>
#include <rclcpp_lifecycle/lifecycle_publisher.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace engagement_manager
{

/// Invoked once per mode/arm request with the vehicle's answer.
using CommandResultCallback =
  std::function<void(uint32_t requestId, bool accepted, const std::string & message)>;

/**
 * Sends EngagementCommands to the MAVLink relay: overrides on the `rc_override`
 * topic, mode changes through `set_mode`, disarm through `arm`.
 *
 * Requests are fire-and-forget. An unavailable service or a failed future is
 * reported to the callback as a rejection, possibly synchronously from dispatch().
 */
class VehicleCommandRelay
{
public:
  VehicleCommandRelay(
    rclcpp_lifecycle::LifecyclePublisher<joylink::msg::RcOverride>::SharedPtr overridePub,
    rclcpp::Client<joylink::srv::SetMode>::SharedPtr setModeClient,
    rclcpp::Client<joylink::srv::Arm>::SharedPtr armClient,
    rclcpp::Logger logger,
    CommandResultCallback onResult);

  void dispatch(const EngagementCommand & command, const rclcpp::Time & stamp);

private:
  void publishOverride(const ChannelOverride & channels, const rclcpp::Time & stamp);
  void sendSetMode(uint32_t requestId, const std::string & mode);
  void sendDisarm(uint32_t requestId);

  rclcpp_lifecycle::LifecyclePublisher<joylink::msg::RcOverride>::SharedPtr overridePub_;
  rclcpp::Client<joylink::srv::SetMode>::SharedPtr setModeClient_;
  rclcpp::Client<joylink::srv::Arm>::SharedPtr armClient_;
  rclcpp::Logger logger_;
  CommandResultCallback onResult_;
};

}  // namespace engagement_manager
