#include <engagement_manager/vehicle_command_relay.hpp>

#include <memory>
#include <utility>

namespace engagement_manager
{

VehicleCommandRelay::VehicleCommandRelay(
  rclcpp_lifecycle::LifecyclePublisher<joylink::msg::RcOverride>::SharedPtr overridePub,
  rclcpp::Client<joylink::srv::SetMode>::SharedPtr setModeClient,
  rclcpp::Client<joylink::srv::Arm>::SharedPtr armClient,
  rclcpp::Logger logger,
  CommandResultCallback onResult)
: overridePub_(std::move(overridePub))
, setModeClient_(std::move(setModeClient))
, armClient_(std::move(armClient))
, logger_(logger)
, onResult_(std::move(onResult))
{
}

void VehicleCommandRelay::dispatch(const EngagementCommand & command, const rclcpp::Time & stamp)
{
  switch (command.type) {
    case CommandType::SetOverride:
      publishOverride(command.channels, stamp);
      break;
    case CommandType::ReleaseOverride:
      RCLCPP_INFO(logger_, "Releasing RC override on all channels");
      publishOverride(ChannelOverride::released(), stamp);
      break;
    case CommandType::RequestMode:
    case CommandType::ReturnToLaunch:
      RCLCPP_INFO(
        logger_, "Requesting mode: mode=%s purpose=%s request=%u",
        command.mode.c_str(), EngagementController::toString(command.purpose), command.requestId);
      sendSetMode(command.requestId, command.mode);
      break;
    case CommandType::Disarm:
      RCLCPP_WARN(logger_, "Requesting disarm: request=%u", command.requestId);
      sendDisarm(command.requestId);
      break;
  }
}

void VehicleCommandRelay::publishOverride(
  const ChannelOverride & channels,
  const rclcpp::Time & stamp)
{
  if (!overridePub_ || !overridePub_->is_activated()) {
    RCLCPP_WARN(logger_, "rc_override publisher inactive; override dropped");
    return;
  }
  joylink::msg::RcOverride msg;
  msg.header.stamp = stamp;
  for (std::size_t i = 0; i < kOverrideChannelCount; ++i) {
    msg.channels[i] = channels.values[i].value_or(joylink::msg::RcOverride::CHANNEL_RELEASE);
  }
  overridePub_->publish(msg);
}

void VehicleCommandRelay::sendSetMode(const uint32_t requestId, const std::string & mode)
{
  if (!setModeClient_ || !setModeClient_->service_is_ready()) {
    onResult_(requestId, false, "set_mode service not available");
    return;
  }

  auto request = std::make_shared<joylink::srv::SetMode::Request>();
  request->mode = mode;
  setModeClient_->async_send_request(
    request,
    [this, requestId](rclcpp::Client<joylink::srv::SetMode>::SharedFuture future) {
      try {
        const auto response = future.get();
        onResult_(requestId, response->success, response->message);
      } catch (const std::exception & e) {
        onResult_(requestId, false, std::string("set_mode exception: ") + e.what());
      }
    });
}

void VehicleCommandRelay::sendDisarm(const uint32_t requestId)
{
  if (!armClient_ || !armClient_->service_is_ready()) {
    onResult_(requestId, false, "arm service not available");
    return;
  }

  auto request = std::make_shared<joylink::srv::Arm::Request>();
  request->arm = false;
  armClient_->async_send_request(
    request,
    [this, requestId](rclcpp::Client<joylink::srv::Arm>::SharedFuture future) {
      try {
        const auto response = future.get();
        onResult_(requestId, response->success, response->message);
      } catch (const std::exception & e) {
        onResult_(requestId, false, std::string("arm exception: ") + e.what());
      }
    });
}

}  // namespace engagement_manager
