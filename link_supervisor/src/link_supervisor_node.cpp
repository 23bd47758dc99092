#include <link_supervisor/link_supervisor_node.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace link_supervisor
{
namespace
{

constexpr char kNodeName[] = "link_supervisor";

uint8_t toStatusState(const SupervisorState state)
{
  switch (state) {
    case SupervisorState::Running:
      return joylink::msg::LinkStatus::STATE_RUNNING;
    case SupervisorState::Backoff:
      return joylink::msg::LinkStatus::STATE_BACKOFF;
    case SupervisorState::Degraded:
      return joylink::msg::LinkStatus::STATE_DEGRADED;
    case SupervisorState::Stopped:
      return joylink::msg::LinkStatus::STATE_STOPPED;
    case SupervisorState::Starting:
    default:
      return joylink::msg::LinkStatus::STATE_STARTING;
  }
}

uint32_t toCount(const int64_t value, const char * name)
{
  if (value < 1) {
    throw std::invalid_argument(std::string(name) + " must be >= 1");
  }
  return static_cast<uint32_t>(value);
}

}  // namespace

LinkSupervisorNode::LinkSupervisorNode(const rclcpp::NodeOptions & options)
: rclcpp::Node(kNodeName, options)
{
  // Relay command line
  this->declare_parameter<std::string>("relay_executable", "mavproxy.py");
  this->declare_parameter<std::string>("master", "/dev/ttyUSB0");
  this->declare_parameter<int>("baud", 115200);
  this->declare_parameter<std::vector<std::string>>(
    "outputs", std::vector<std::string>{"udp:127.0.0.1:14550"});
  this->declare_parameter<std::vector<std::string>>("extra_args", std::vector<std::string>{});
  this->declare_parameter<std::vector<std::string>>(
    "joystick_args", std::vector<std::string>{"--load-module=joylink_bridge"});
  this->declare_parameter<std::vector<std::string>>(
    "diagnostic_args", std::vector<std::string>{"--show-errors"});

  // Restart policy
  this->declare_parameter<double>("backoff.initial_s", 5.0);
  this->declare_parameter<double>("backoff.multiplier", 2.0);
  this->declare_parameter<double>("backoff.max_s", 60.0);
  this->declare_parameter<double>("sustained_uptime_s", 120.0);
  this->declare_parameter<int>("degrade_after_failures", 3);
  this->declare_parameter<int>("diagnostics_after_failures", 5);
  this->declare_parameter<int>("alert_after_failures", 10);
  this->declare_parameter<double>("terminate_grace_s", 10.0);
  this->declare_parameter<double>("liveness_terminate_grace_s", 2.0);
  this->declare_parameter<int>("joystick_failure_exit_code", 42);

  const bool debug = this->declare_parameter<bool>("debug", false);
  const std::string logFile = this->declare_parameter<std::string>("log_file", "");
  checkRateHz_ = this->declare_parameter<double>("check_rate_hz", 2.0);
  livenessTimeoutS_ = this->declare_parameter<double>("liveness_timeout_s", 0.0);
  vehicleStatusTopic_ =
    this->declare_parameter<std::string>("vehicle_status_topic", "vehicle_status");

  if (debug) {
    get_logger().set_level(rclcpp::Logger::Level::Debug);
  }

  try {
    if (checkRateHz_ <= 0.0) {
      throw std::invalid_argument("check_rate_hz must be > 0");
    }
    if (livenessTimeoutS_ < 0.0) {
      throw std::invalid_argument("liveness_timeout_s must be >= 0");
    }
    supervisor_ = std::make_unique<LinkSupervisor>(
      readSupervisorConfig(), readCommandConfig(), launcher_);
  } catch (const std::invalid_argument & e) {
    RCLCPP_FATAL(get_logger(), "Invalid link supervisor configuration: %s", e.what());
    throw;
  }

  openJournal(debug, logFile);

  // Latched so engagement_manager reads the joystick flag whenever it activates.
  statusPub_ = this->create_publisher<joylink::msg::LinkStatus>(
    "link_status", rclcpp::QoS(1).reliable().transient_local());
  if (livenessTimeoutS_ > 0.0) {
    vehicleStatusSub_ = this->create_subscription<joylink::msg::VehicleStatus>(
      vehicleStatusTopic_, rclcpp::QoS(10).reliable(),
      std::bind(&LinkSupervisorNode::onVehicleStatus, this, std::placeholders::_1));
  }

  const auto period = std::chrono::duration<double>(1.0 / checkRateHz_);
  checkTimer_ = this->create_wall_timer(
    std::chrono::duration_cast<std::chrono::nanoseconds>(period),
    std::bind(&LinkSupervisorNode::onTimer, this));

  const auto & config = supervisor_->config();
  RCLCPP_INFO(
    get_logger(),
    "Configured link_supervisor (rate=%.1fHz, backoff=%.1f..%.1fs x%.1f, degrade_after=%u, "
    "diagnostics_after=%u, sustained_uptime=%.1fs, liveness_timeout=%.1fs, debug=%s)",
    checkRateHz_, config.backoff.initial_s, config.backoff.max_s, config.backoff.multiplier,
    config.degradeAfterFailures, config.diagnosticsAfterFailures, config.sustainedUptime_s,
    livenessTimeoutS_, debug ? "true" : "false");

  // First spawn happens immediately rather than one period later.
  onTimer();
}

LinkSupervisorNode::~LinkSupervisorNode()
{
  shutdown();
}

SupervisorConfig LinkSupervisorNode::readSupervisorConfig()
{
  SupervisorConfig config;
  config.backoff.initial_s = this->get_parameter("backoff.initial_s").as_double();
  config.backoff.multiplier = this->get_parameter("backoff.multiplier").as_double();
  config.backoff.max_s = this->get_parameter("backoff.max_s").as_double();
  config.sustainedUptime_s = this->get_parameter("sustained_uptime_s").as_double();
  config.degradeAfterFailures = toCount(
    this->get_parameter("degrade_after_failures").as_int(), "degrade_after_failures");
  config.diagnosticsAfterFailures = toCount(
    this->get_parameter("diagnostics_after_failures").as_int(), "diagnostics_after_failures");
  config.alertAfterFailures = toCount(
    this->get_parameter("alert_after_failures").as_int(), "alert_after_failures");
  config.terminateGrace_s = this->get_parameter("terminate_grace_s").as_double();
  config.livenessTerminateGrace_s =
    this->get_parameter("liveness_terminate_grace_s").as_double();
  config.joystickFailureExitCode =
    static_cast<int>(this->get_parameter("joystick_failure_exit_code").as_int());
  return config;
}

LinkCommandConfig LinkSupervisorNode::readCommandConfig()
{
  LinkCommandConfig config;
  config.relayExecutable = this->get_parameter("relay_executable").as_string();
  config.master = this->get_parameter("master").as_string();
  config.baud = static_cast<int>(this->get_parameter("baud").as_int());
  config.outputs = this->get_parameter("outputs").as_string_array();
  config.extraArgs = this->get_parameter("extra_args").as_string_array();
  config.joystickArgs = this->get_parameter("joystick_args").as_string_array();
  config.diagnosticArgs = this->get_parameter("diagnostic_args").as_string_array();
  return config;
}

void LinkSupervisorNode::openJournal(const bool debug, const std::string & logFile)
{
  if (logFile.empty()) {
    return;
  }
  if (!debug) {
    RCLCPP_WARN(
      get_logger(), "debug is disabled; ignoring log_file=%s and logging to console only",
      logFile.c_str());
    return;
  }
  std::string error;
  if (!journal_.open(logFile, error)) {
    RCLCPP_WARN(
      get_logger(), "Could not open log_file %s: %s", logFile.c_str(), error.c_str());
    return;
  }
  RCLCPP_DEBUG(get_logger(), "Mirroring supervisor log to %s", logFile.c_str());
}

void LinkSupervisorNode::shutdown()
{
  if (checkTimer_) {
    checkTimer_->cancel();
  }
  if (!supervisor_ || supervisor_->state() == SupervisorState::Stopped) {
    return;
  }
  RCLCPP_INFO(get_logger(), "Stop requested; terminating relay if needed");
  handleRecords(supervisor_->shutdown());
  if (statusPub_) {
    publishStatus(LinkSupervisor::Clock::now());
  }
  journal_.close();
}

void LinkSupervisorNode::onVehicleStatus(const joylink::msg::VehicleStatus::SharedPtr)
{
  std::scoped_lock lock(mutex_);
  vehicleStatusSeen_ = true;
  lastVehicleStatusTime_ = LinkSupervisor::Clock::now();
}

void LinkSupervisorNode::onTimer()
{
  if (!supervisor_) {
    return;
  }
  const auto now = LinkSupervisor::Clock::now();
  handleRecords(supervisor_->step(now));
  checkLiveness(now);
  publishStatus(now);
}

void LinkSupervisorNode::checkLiveness(const LinkSupervisor::Clock::time_point now)
{
  if (livenessTimeoutS_ <= 0.0 || !supervisor_->childRunning()) {
    return;
  }

  // Silence is measured from the later of the child start and the last status.
  LinkSupervisor::Clock::time_point reference = supervisor_->startedAt();
  {
    std::scoped_lock lock(mutex_);
    if (vehicleStatusSeen_) {
      reference = std::max(reference, lastVehicleStatusTime_);
    }
  }
  const double silence = std::chrono::duration<double>(now - reference).count();
  if (silence <= livenessTimeoutS_) {
    return;
  }
  handleRecords(
    supervisor_->reportLivenessLost(
      now, "no vehicle_status for " + std::to_string(static_cast<int>(silence)) + "s"));
}

void LinkSupervisorNode::handleRecords(const std::vector<SupervisorRecord> & records)
{
  for (const auto & record : records) {
    lastReason_ = record.reasonCode;
    const std::string line =
      std::string("Supervisor transition: from=") + LinkSupervisor::toString(record.from) +
      " to=" + LinkSupervisor::toString(record.to) + " reason=" + record.reasonCode +
      " detail=" + record.detail;

    switch (record.severity) {
      case RecordSeverity::Error:
        RCLCPP_ERROR(get_logger(), "%s", line.c_str());
        break;
      case RecordSeverity::Warning:
        RCLCPP_WARN(get_logger(), "%s", line.c_str());
        break;
      case RecordSeverity::Info:
      default:
        RCLCPP_INFO(get_logger(), "%s", line.c_str());
        break;
    }

    if (journal_.isOpen() && !journal_.append(
        std::string(LinkSupervisor::toString(record.severity)) + " " + line) &&
      !journalFailureReported_)
    {
      journalFailureReported_ = true;
      RCLCPP_WARN(get_logger(), "Writing to log_file failed; continuing on console only");
    }
  }
}

void LinkSupervisorNode::publishStatus(const LinkSupervisor::Clock::time_point now)
{
  joylink::msg::LinkStatus status;
  status.header.stamp = this->now();
  const SupervisorState state = supervisor_->state();
  status.state = toStatusState(state);
  status.state_name = LinkSupervisor::toString(state);
  status.pid = supervisor_->childPid();
  status.consecutive_failures = supervisor_->consecutiveFailures();
  status.degraded = supervisor_->degraded();
  status.diagnostics_enabled = supervisor_->diagnosticsEnabled();
  status.joystick_enabled = supervisor_->joystickEnabled();
  status.backoff_s = state == SupervisorState::Backoff ? supervisor_->currentBackoff_s() : 0.0;
  status.uptime_s = supervisor_->childRunning() ?
    std::chrono::duration<double>(now - supervisor_->startedAt()).count() : 0.0;
  status.reason = lastReason_;
  statusPub_->publish(status);
}

}  // namespace link_supervisor
