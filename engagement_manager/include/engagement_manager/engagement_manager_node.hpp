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
 * @file engagement_manager_node.hpp
 * @brief Joystick engagement ROS2 lifecycle component.
 *
 * Pipeline position:
 *   Consumes: sensor_msgs/Joy (external joystick driver), VehicleStatus (relay)
 *   Produces: RcOverride (rc_override), EngagementStatus (engagement_status)
 *   Commands: relay `set_mode` and `arm` services
 *
 * The node is a thin adapter around EngagementController. A wall timer at
 * tick_rate_hz snapshots the latest Joy/VehicleStatus under the mutex, runs one
 * controller tick, and hands the returned commands to VehicleCommandRelay. Service
 * results come back on executor threads and are fed to onCommandResult().
 *
 * Lifecycle:
 *   configure  -> read/validate parameters, build controller, create pubs/subs/clients
 *   activate   -> start the tick timer
 *   deactivate -> drop any engagement (release + disconnect mode), stop the timer
 *   shutdown   -> same as deactivate, then cleanup
 */

#pragma once

#include <engagement_manager/engagement_controller.hpp>
#include <engagement_manager/vehicle_command_relay.hpp>

#include <joylink/msg/engagement_status.hpp>
#include <joylink/msg/link_status.hpp>
#include <joylink/msg/rc_override.hpp>
#include <joylink/msg/vehicle_status.hpp>
#include <joylink/srv/arm.hpp>
#include <joylink/srv/set_mode.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <rclcpp_lifecycle/lifecycle_publisher.hpp>
#include <sensor_msgs/msg/joy.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace engagement_manager
{

/**
 * @struct JoyMapping
 * @brief sensor_msgs/Joy indices for the four axes and three buttons.
 */
struct JoyMapping
{
  int rollAxis{0};
  int pitchAxis{1};
  int yawAxis{2};
  int throttleAxis{3};
  int triggerButton{0};
  int rtlButton{5};
  int disarmButton{6};

  /// Throws std::invalid_argument on a negative index.
  void validate() const;
  int maxAxis() const;
  int maxButton() const;
};

class EngagementManagerNode : public rclcpp_lifecycle::LifecycleNode
{
public:
  explicit EngagementManagerNode(const rclcpp::NodeOptions & options);

private:
  using CallbackReturn = rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

  CallbackReturn on_configure(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_activate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_deactivate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_cleanup(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_shutdown(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_error(const rclcpp_lifecycle::State & state) override;

  void onJoy(const sensor_msgs::msg::Joy::SharedPtr msg);
  void onVehicleStatus(const joylink::msg::VehicleStatus::SharedPtr msg);
  void onLinkStatus(const joylink::msg::LinkStatus::SharedPtr msg);
  void onTick();
  void onCommandResult(uint32_t requestId, bool accepted, const std::string & message);

  /// Must be called with mutex_ held.
  TickInput buildInput(std::chrono::steady_clock::time_point now);
  /// Must be called with mutex_ held.
  joylink::msg::EngagementStatus buildStatus(bool joystickConnected) const;

  /// Releases any engagement on the way down (deactivate/shutdown/error).
  void abortEngagement(const std::string & reasonCode);
  /// Reads the latched link_status flag once per activation.
  void applyIntegrationFlag();
  void dispatch(const TickResult & result);
  void logTransition(const EngagementTransition & transition) const;

  EngagementConfig readEngagementConfig();
  JoyMapping readJoyMapping();

  mutable std::mutex mutex_;
  sensor_msgs::msg::Joy::SharedPtr latestJoy_;
  std::chrono::steady_clock::time_point lastJoyTime_;
  joylink::msg::VehicleStatus::SharedPtr latestVehicleStatus_;
  std::chrono::steady_clock::time_point lastVehicleStatusTime_;
  bool joystickConnected_{false};
  std::optional<bool> linkJoystickEnabled_;

  double tickRateHz_{20.0};
  double joystickTimeoutS_{0.5};
  double vehicleStatusTimeoutS_{2.0};
  std::string joyTopic_{"joy"};
  std::string vehicleStatusTopic_{"vehicle_status"};
  std::string linkStatusTopic_{"link_status"};
  JoyMapping mapping_;

  std::unique_ptr<EngagementController> controller_;
  std::unique_ptr<VehicleCommandRelay> relay_;

  rclcpp::Subscription<sensor_msgs::msg::Joy>::SharedPtr joySub_;
  rclcpp::Subscription<joylink::msg::VehicleStatus>::SharedPtr vehicleStatusSub_;
  rclcpp::Subscription<joylink::msg::LinkStatus>::SharedPtr linkStatusSub_;
  rclcpp_lifecycle::LifecyclePublisher<joylink::msg::RcOverride>::SharedPtr overridePub_;
  rclcpp_lifecycle::LifecyclePublisher<joylink::msg::EngagementStatus>::SharedPtr statusPub_;
  rclcpp::Client<joylink::srv::SetMode>::SharedPtr setModeClient_;
  rclcpp::Client<joylink::srv::Arm>::SharedPtr armClient_;

  rclcpp::TimerBase::SharedPtr tickTimer_;

  bool autoStart_{true};
  rclcpp::TimerBase::SharedPtr startupTimer_;
};

}  // namespace engagement_manager
