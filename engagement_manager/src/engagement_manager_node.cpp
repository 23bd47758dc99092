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
#include <engagement_manager/engagement_manager_node.hpp>

#include <lifecycle_msgs/msg/state.hpp>
#include <lifecycle_msgs/msg/transition.hpp>
#include <rclcpp_components/register_node_macro.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace engagement_manager
{
namespace
{

constexpr char kNodeName[] = "engagement_manager";

uint8_t toStatusState(const EngagementState state)
{
  switch (state) {
    case EngagementState::Engaged:
      return joylink::msg::EngagementStatus::STATE_ENGAGED;
    case EngagementState::ManualOverrideOnly:
      return joylink::msg::EngagementStatus::STATE_MANUAL_OVERRIDE_ONLY;
    case EngagementState::Disengaged:
    default:
      return joylink::msg::EngagementStatus::STATE_DISENGAGED;
  }
}

}  // namespace

void JoyMapping::validate() const
{
  if (std::min({rollAxis, pitchAxis, yawAxis, throttleAxis}) < 0) {
    throw std::invalid_argument("axes.* indices must be >= 0");
  }
  if (std::min({triggerButton, rtlButton, disarmButton}) < 0) {
    throw std::invalid_argument("buttons.* indices must be >= 0");
  }
}

int JoyMapping::maxAxis() const
{
  return std::max({rollAxis, pitchAxis, yawAxis, throttleAxis});
}

int JoyMapping::maxButton() const
{
  return std::max({triggerButton, rtlButton, disarmButton});
}

EngagementManagerNode::EngagementManagerNode(const rclcpp::NodeOptions & options)
: rclcpp_lifecycle::LifecycleNode(kNodeName, options)
{
  autoStart_ = this->declare_parameter<bool>("auto_start", true);
  tickRateHz_ = this->declare_parameter<double>("tick_rate_hz", 20.0);
  joyTopic_ = this->declare_parameter<std::string>("joy_topic", "joy");
  vehicleStatusTopic_ =
    this->declare_parameter<std::string>("vehicle_status_topic", "vehicle_status");
  joystickTimeoutS_ = this->declare_parameter<double>("joystick_timeout_s", 0.5);
  vehicleStatusTimeoutS_ = this->declare_parameter<double>("vehicle_status_timeout_s", 2.0);
  linkStatusTopic_ = this->declare_parameter<std::string>("link_status_topic", "link_status");

  // Mode handling
  this->declare_parameter<bool>("mode_switching_enabled", true);
  this->declare_parameter<std::string>("modes.engage", "GUIDED");
  this->declare_parameter<std::vector<std::string>>(
    "modes.fallback", std::vector<std::string>{"LOITER", "STABILIZE"});
  this->declare_parameter<std::string>("modes.disconnect", "");
  this->declare_parameter<std::vector<std::string>>(
    "modes.excluded_restore", std::vector<std::string>{});
  this->declare_parameter<std::string>("modes.rtl", "RTL");

  // Joy indices
  this->declare_parameter<int>("axes.roll", 0);
  this->declare_parameter<int>("axes.pitch", 1);
  this->declare_parameter<int>("axes.yaw", 2);
  this->declare_parameter<int>("axes.throttle", 3);
  this->declare_parameter<int>("buttons.trigger", 0);
  this->declare_parameter<int>("buttons.rtl", 5);
  this->declare_parameter<int>("buttons.disarm", 6);

  // PWM mapping
  this->declare_parameter<int>("override.center_pwm", 1500);
  this->declare_parameter<int>("override.min_pwm", 1000);
  this->declare_parameter<int>("override.max_pwm", 2000);
  this->declare_parameter<double>("override.span_pwm", 500.0);
  this->declare_parameter<double>("override.gain", 1.0);
  this->declare_parameter<double>("override.deadband", 0.0);

  if (autoStart_) {
    startupTimer_ = this->create_wall_timer(
      std::chrono::milliseconds(200),
      [this]() {
        startupTimer_->cancel();
        RCLCPP_INFO(get_logger(), "Auto-start: triggering configure");
        auto configResult = this->trigger_transition(
          lifecycle_msgs::msg::Transition::TRANSITION_CONFIGURE);
        if (configResult.id() != lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
          RCLCPP_ERROR(get_logger(), "Auto-configure failed (state=%s)",
            configResult.label().c_str());
          return;
        }
        auto activateResult = this->trigger_transition(
          lifecycle_msgs::msg::Transition::TRANSITION_ACTIVATE);
        if (activateResult.id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
          RCLCPP_ERROR(get_logger(), "Auto-activate failed (state=%s)",
            activateResult.label().c_str());
          return;
        }
        RCLCPP_INFO(get_logger(), "Auto-start complete: ACTIVE");
      });
  }
}

EngagementConfig EngagementManagerNode::readEngagementConfig()
{
  EngagementConfig config;
  config.modeSwitchingEnabled = this->get_parameter("mode_switching_enabled").as_bool();
  config.engageMode = this->get_parameter("modes.engage").as_string();
  config.fallbackChain = this->get_parameter("modes.fallback").as_string_array();
  config.disconnectMode = this->get_parameter("modes.disconnect").as_string();
  config.excludedRestoreModes = this->get_parameter("modes.excluded_restore").as_string_array();
  config.rtlMode = this->get_parameter("modes.rtl").as_string();

  auto pwm = [this](const char * name) {
      const int64_t value = this->get_parameter(name).as_int();
      if (value < 0 || value > 65535) {
        throw std::invalid_argument(std::string(name) + " must be in [0, 65535]");
      }
      return static_cast<uint16_t>(value);
    };
  config.encoder.centerPwm = pwm("override.center_pwm");
  config.encoder.minPwm = pwm("override.min_pwm");
  config.encoder.maxPwm = pwm("override.max_pwm");
  config.encoder.spanPwm = this->get_parameter("override.span_pwm").as_double();
  config.encoder.gain = this->get_parameter("override.gain").as_double();
  config.encoder.deadband = this->get_parameter("override.deadband").as_double();
  return config;
}

JoyMapping EngagementManagerNode::readJoyMapping()
{
  JoyMapping mapping;
  mapping.rollAxis = static_cast<int>(this->get_parameter("axes.roll").as_int());
  mapping.pitchAxis = static_cast<int>(this->get_parameter("axes.pitch").as_int());
  mapping.yawAxis = static_cast<int>(this->get_parameter("axes.yaw").as_int());
  mapping.throttleAxis = static_cast<int>(this->get_parameter("axes.throttle").as_int());
  mapping.triggerButton = static_cast<int>(this->get_parameter("buttons.trigger").as_int());
  mapping.rtlButton = static_cast<int>(this->get_parameter("buttons.rtl").as_int());
  mapping.disarmButton = static_cast<int>(this->get_parameter("buttons.disarm").as_int());
  mapping.validate();
  return mapping;
}

EngagementManagerNode::CallbackReturn EngagementManagerNode::on_configure(
  const rclcpp_lifecycle::State &)
{
  if (tickRateHz_ <= 0.0) {
    RCLCPP_FATAL(get_logger(), "tick_rate_hz must be > 0");
    return CallbackReturn::FAILURE;
  }
  if (joystickTimeoutS_ <= 0.0 || vehicleStatusTimeoutS_ <= 0.0) {
    RCLCPP_FATAL(get_logger(), "joystick_timeout_s and vehicle_status_timeout_s must be > 0");
    return CallbackReturn::FAILURE;
  }

  // Config faults are caught once here; nothing below throws at runtime.
  try {
    mapping_ = readJoyMapping();
    controller_ = std::make_unique<EngagementController>(readEngagementConfig());
  } catch (const std::invalid_argument & e) {
    RCLCPP_FATAL(get_logger(), "Invalid engagement configuration: %s", e.what());
    return CallbackReturn::FAILURE;
  }

  const auto qos = rclcpp::QoS(10).reliable();
  joySub_ = this->create_subscription<sensor_msgs::msg::Joy>(
    joyTopic_, rclcpp::SensorDataQoS(),
    std::bind(&EngagementManagerNode::onJoy, this, std::placeholders::_1));
  vehicleStatusSub_ = this->create_subscription<joylink::msg::VehicleStatus>(
    vehicleStatusTopic_, qos,
    std::bind(&EngagementManagerNode::onVehicleStatus, this, std::placeholders::_1));
  // The supervisor latches its status, so the last value arrives even if it published first.
  linkStatusSub_ = this->create_subscription<joylink::msg::LinkStatus>(
    linkStatusTopic_, rclcpp::QoS(1).reliable().transient_local(),
    std::bind(&EngagementManagerNode::onLinkStatus, this, std::placeholders::_1));

  overridePub_ = this->create_publisher<joylink::msg::RcOverride>("rc_override", qos);
  statusPub_ = this->create_publisher<joylink::msg::EngagementStatus>("engagement_status", qos);

  setModeClient_ = this->create_client<joylink::srv::SetMode>("set_mode");
  armClient_ = this->create_client<joylink::srv::Arm>("arm");

  relay_ = std::make_unique<VehicleCommandRelay>(
    overridePub_, setModeClient_, armClient_, get_logger(),
    [this](uint32_t requestId, bool accepted, const std::string & message) {
      onCommandResult(requestId, accepted, message);
    });

  // Tick timer (created but not started until activate)
  const auto period = std::chrono::duration<double>(1.0 / tickRateHz_);
  tickTimer_ = this->create_wall_timer(
    std::chrono::duration_cast<std::chrono::nanoseconds>(period),
    std::bind(&EngagementManagerNode::onTick, this));
  tickTimer_->cancel();

  const auto & config = controller_->config();
  RCLCPP_INFO(
    get_logger(),
    "Configured engagement_manager (rate=%.1fHz, joy_topic=%s, mode_switching=%s, engage=%s, "
    "fallback_primary=%s, disconnect=%s)",
    tickRateHz_, joyTopic_.c_str(), config.modeSwitchingEnabled ? "true" : "false",
    config.engageMode.c_str(),
    config.fallbackChain.empty() ? "-" : config.fallbackChain.front().c_str(),
    config.modeSwitchingEnabled ? config.effectiveDisconnectMode().c_str() : "-");
  return CallbackReturn::SUCCESS;
}

EngagementManagerNode::CallbackReturn EngagementManagerNode::on_activate(
  const rclcpp_lifecycle::State &)
{
  if (!overridePub_ || !statusPub_ || !tickTimer_) {
    return CallbackReturn::FAILURE;
  }
  applyIntegrationFlag();
  overridePub_->on_activate();
  statusPub_->on_activate();
  tickTimer_->reset();
  RCLCPP_INFO(get_logger(), "Activated engagement_manager");
  return CallbackReturn::SUCCESS;
}

EngagementManagerNode::CallbackReturn EngagementManagerNode::on_deactivate(
  const rclcpp_lifecycle::State &)
{
  if (tickTimer_) {
    tickTimer_->cancel();
  }
  // Publishers must still be active for the release to go out.
  abortEngagement("DEACTIVATED");
  if (overridePub_) {
    overridePub_->on_deactivate();
  }
  if (statusPub_) {
    statusPub_->on_deactivate();
  }
  RCLCPP_INFO(get_logger(), "Deactivated engagement_manager");
  return CallbackReturn::SUCCESS;
}

EngagementManagerNode::CallbackReturn EngagementManagerNode::on_cleanup(
  const rclcpp_lifecycle::State &)
{
  tickTimer_.reset();
  joySub_.reset();
  vehicleStatusSub_.reset();
  linkStatusSub_.reset();
  relay_.reset();
  overridePub_.reset();
  statusPub_.reset();
  setModeClient_.reset();
  armClient_.reset();

  {
    std::scoped_lock lock(mutex_);
    controller_.reset();
    latestJoy_.reset();
    latestVehicleStatus_.reset();
    linkJoystickEnabled_.reset();
    joystickConnected_ = false;
  }

  RCLCPP_INFO(get_logger(), "Cleaned up engagement_manager");
  return CallbackReturn::SUCCESS;
}

EngagementManagerNode::CallbackReturn EngagementManagerNode::on_shutdown(
  const rclcpp_lifecycle::State &)
{
  if (tickTimer_) {
    tickTimer_->cancel();
  }
  abortEngagement("SHUTDOWN");
  (void)on_cleanup(this->get_current_state());
  return CallbackReturn::SUCCESS;
}

EngagementManagerNode::CallbackReturn EngagementManagerNode::on_error(
  const rclcpp_lifecycle::State &)
{
  if (tickTimer_) {
    tickTimer_->cancel();
  }
  abortEngagement("LIFECYCLE_ERROR");
  if (overridePub_ && overridePub_->is_activated()) {
    overridePub_->on_deactivate();
  }
  if (statusPub_ && statusPub_->is_activated()) {
    statusPub_->on_deactivate();
  }
  return CallbackReturn::SUCCESS;
}

void EngagementManagerNode::onJoy(const sensor_msgs::msg::Joy::SharedPtr msg)
{
  std::scoped_lock lock(mutex_);
  latestJoy_ = msg;
  lastJoyTime_ = std::chrono::steady_clock::now();
}

void EngagementManagerNode::onVehicleStatus(const joylink::msg::VehicleStatus::SharedPtr msg)
{
  std::scoped_lock lock(mutex_);
  latestVehicleStatus_ = msg;
  lastVehicleStatusTime_ = std::chrono::steady_clock::now();
}

void EngagementManagerNode::onLinkStatus(const joylink::msg::LinkStatus::SharedPtr msg)
{
  std::scoped_lock lock(mutex_);
  linkJoystickEnabled_ = msg->joystick_enabled;
}

void EngagementManagerNode::applyIntegrationFlag()
{
  std::scoped_lock lock(mutex_);
  if (!controller_) {
    return;
  }
  // No supervisor status yet: run with integration on.
  const bool enabled = linkJoystickEnabled_.value_or(true);
  if (!controller_->setIntegrationEnabled(enabled)) {
    RCLCPP_WARN(get_logger(), "Joystick integration flag not applied: session still engaged");
    return;
  }
  RCLCPP_INFO(
    get_logger(), "Joystick integration %s (link_status %s)", enabled ? "enabled" : "disabled",
    linkJoystickEnabled_.has_value() ? "received" : "not yet received");
}

TickInput EngagementManagerNode::buildInput(const std::chrono::steady_clock::time_point now)
{
  TickInput input;

  if (latestVehicleStatus_ && latestVehicleStatus_->connected) {
    const double age = std::chrono::duration<double>(now - lastVehicleStatusTime_).count();
    if (age <= vehicleStatusTimeoutS_ && !latestVehicleStatus_->mode.empty()) {
      input.currentMode = latestVehicleStatus_->mode;
    }
  }

  if (!latestJoy_) {
    return input;
  }
  const double joyAge = std::chrono::duration<double>(now - lastJoyTime_).count();
  if (joyAge > joystickTimeoutS_) {
    return input;
  }

  const auto & axes = latestJoy_->axes;
  const auto & buttons = latestJoy_->buttons;
  if (static_cast<int>(axes.size()) <= mapping_.maxAxis() ||
    static_cast<int>(buttons.size()) <= mapping_.maxButton())
  {
    RCLCPP_WARN_THROTTLE(
      get_logger(), *get_clock(), 2000,
      "Malformed Joy frame treated as disconnect (axes=%zu buttons=%zu)",
      axes.size(), buttons.size());
    return input;
  }

  input.connected = true;
  input.axes.roll = axes[mapping_.rollAxis];
  input.axes.pitch = axes[mapping_.pitchAxis];
  input.axes.yaw = axes[mapping_.yawAxis];
  input.axes.throttle = axes[mapping_.throttleAxis];
  input.trigger = buttons[mapping_.triggerButton] != 0;
  input.rtl = buttons[mapping_.rtlButton] != 0;
  input.disarm = buttons[mapping_.disarmButton] != 0;
  return input;
}

joylink::msg::EngagementStatus EngagementManagerNode::buildStatus(
  const bool joystickConnected) const
{
  joylink::msg::EngagementStatus status;
  const EngagementState state = controller_->state();
  status.state = toStatusState(state);
  status.state_name = EngagementController::toString(state);
  status.joystick_connected = joystickConnected;
  status.mode_switching_enabled = controller_->config().modeSwitchingEnabled;
  status.integration_enabled = controller_->integrationEnabled();
  status.snapshot_mode = controller_->arbiter().snapshot().value_or("");
  const ChannelOverride & current = controller_->currentOverride();
  for (std::size_t i = 0; i < kOverrideChannelCount; ++i) {
    status.channels[i] =
      current.values[i].value_or(joylink::msg::RcOverride::CHANNEL_RELEASE);
  }
  status.reason = controller_->lastReason();
  return status;
}

void EngagementManagerNode::onTick()
{
  if (!relay_ || !statusPub_ || !statusPub_->is_activated()) {
    return;
  }

  TickResult result;
  joylink::msg::EngagementStatus status;
  bool connectionChanged = false;
  bool connected = false;
  {
    std::scoped_lock lock(mutex_);
    if (!controller_) {
      return;
    }
    const TickInput input = buildInput(std::chrono::steady_clock::now());
    connected = input.connected;
    connectionChanged = connected != joystickConnected_;
    joystickConnected_ = connected;
    result = controller_->tick(input);
    status = buildStatus(connected);
  }

  if (connectionChanged) {
    if (connected) {
      RCLCPP_INFO(get_logger(), "Joystick input available");
    } else {
      RCLCPP_WARN(get_logger(), "Joystick input lost");
    }
  }

  if (result.transition.has_value()) {
    logTransition(*result.transition);
  }
  dispatch(result);

  status.header.stamp = this->now();
  statusPub_->publish(status);
}

void EngagementManagerNode::onCommandResult(
  const uint32_t requestId,
  const bool accepted,
  const std::string & message)
{
  CommandResultOutcome outcome;
  {
    std::scoped_lock lock(mutex_);
    if (!controller_) {
      return;
    }
    outcome = controller_->onCommandResult(requestId, accepted);
  }

  if (outcome.alert) {
    RCLCPP_ERROR(
      get_logger(), "Command result: request=%u purpose=%s mode=%s accepted=%s reason=%s detail=%s",
      requestId, EngagementController::toString(outcome.purpose), outcome.mode.c_str(),
      accepted ? "true" : "false", outcome.reasonCode.c_str(), message.c_str());
  } else {
    RCLCPP_INFO(
      get_logger(), "Command result: request=%u purpose=%s mode=%s accepted=%s reason=%s",
      requestId, EngagementController::toString(outcome.purpose), outcome.mode.c_str(),
      accepted ? "true" : "false", outcome.reasonCode.c_str());
  }

  TickResult followUp;
  followUp.commands = std::move(outcome.commands);
  dispatch(followUp);
}

void EngagementManagerNode::abortEngagement(const std::string & reasonCode)
{
  TickResult result;
  {
    std::scoped_lock lock(mutex_);
    if (!controller_) {
      return;
    }
    result = controller_->abort(reasonCode);
    joystickConnected_ = false;
  }
  if (result.transition.has_value()) {
    logTransition(*result.transition);
  }
  dispatch(result);
}

void EngagementManagerNode::dispatch(const TickResult & result)
{
  if (!relay_) {
    return;
  }
  const rclcpp::Time stamp = this->now();
  for (const auto & command : result.commands) {
    relay_->dispatch(command, stamp);
  }
}

void EngagementManagerNode::logTransition(const EngagementTransition & transition) const
{
  if (transition.event == EngagementEvent::InputLost ||
    transition.event == EngagementEvent::Aborted)
  {
    RCLCPP_WARN(
      get_logger(), "Engagement transition: from=%s event=%s to=%s reason=%s",
      EngagementController::toString(transition.from),
      EngagementController::toString(transition.event),
      EngagementController::toString(transition.to), transition.reasonCode.c_str());
    return;
  }
  RCLCPP_INFO(
    get_logger(), "Engagement transition: from=%s event=%s to=%s reason=%s",
    EngagementController::toString(transition.from),
    EngagementController::toString(transition.event),
    EngagementController::toString(transition.to), transition.reasonCode.c_str());
}

}  // namespace engagement_manager

RCLCPP_COMPONENTS_REGISTER_NODE(engagement_manager::EngagementManagerNode)
