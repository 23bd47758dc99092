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
#include <engagement_manager/engagement_controller.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace engagement_manager
{
namespace
{

// Outstanding requests whose result never arrived are dropped oldest-first.
constexpr std::size_t kMaxOutstandingRequests = 32;

}  // namespace

void EngagementConfig::validate() const
{
  encoder.validate();
  if (!modeSwitchingEnabled) {
    return;
  }
  if (engageMode.empty()) {
    throw std::invalid_argument("modes.engage must not be empty");
  }
  if (fallbackChain.empty()) {
    throw std::invalid_argument("modes.fallback must name at least one mode");
  }
  const bool hasEmptyEntry = std::any_of(
    fallbackChain.begin(), fallbackChain.end(),
    [](const std::string & mode) {return mode.empty();});
  if (hasEmptyEntry) {
    throw std::invalid_argument("modes.fallback must not contain empty entries");
  }
  if (rtlMode.empty()) {
    throw std::invalid_argument("modes.rtl must not be empty");
  }
}

std::string EngagementConfig::effectiveDisconnectMode() const
{
  if (!disconnectMode.empty()) {
    return normalizeMode(disconnectMode);
  }
  return fallbackChain.empty() ? std::string() : normalizeMode(fallbackChain.back());
}

EngagementController::EngagementController(EngagementConfig config)
: config_(std::move(config)),
  encoder_(config_.encoder),
  arbiter_(config_.excludedRestoreModes)
{
  config_.validate();
}

bool EngagementController::setIntegrationEnabled(const bool enabled)
{
  if (enabled == integrationEnabled_) {
    return true;
  }
  if (engaged()) {
    return false;
  }
  integrationEnabled_ = enabled;
  primed_ = false;
  lastReason_ = enabled ? "INTEGRATION_ENABLED" : "INTEGRATION_DISABLED";
  return true;
}

TickResult EngagementController::tick(const TickInput & input)
{
  TickResult result;

  if (!integrationEnabled_) {
    return result;
  }

  if (!input.connected) {
    // Un-prime so the first frame after reconnect only latches levels.
    primed_ = false;
    if (engaged()) {
      dropToSafe(EngagementEvent::InputLost, "INPUT_LOST", result);
    }
    return result;
  }

  if (!primed_) {
    prevTrigger_ = input.trigger;
    prevRtl_ = input.rtl;
    prevDisarm_ = input.disarm;
    primed_ = true;
    return result;
  }

  const bool triggerPressed = input.trigger && !prevTrigger_;
  const bool triggerReleased = !input.trigger && prevTrigger_;
  const bool rtlPressed = input.rtl && !prevRtl_;
  const bool disarmPressed = input.disarm && !prevDisarm_;
  prevTrigger_ = input.trigger;
  prevRtl_ = input.rtl;
  prevDisarm_ = input.disarm;

  if (triggerPressed && !engaged()) {
    engage(input, result);
  } else if (triggerReleased && engaged()) {
    release(result);
  }

  if (engaged()) {
    // calibration_ is always present while engaged.
    override_ = encoder_.encode(input.axes, *calibration_);
    EngagementCommand command;
    command.type = CommandType::SetOverride;
    command.purpose = CommandPurpose::Override;
    command.channels = override_;
    result.commands.push_back(command);
  }

  // Auxiliary buttons fire once per press regardless of engagement.
  if (rtlPressed) {
    result.commands.push_back(
      makeRequest(CommandType::ReturnToLaunch, CommandPurpose::ReturnToLaunch, config_.rtlMode));
  }
  if (disarmPressed) {
    result.commands.push_back(makeRequest(CommandType::Disarm, CommandPurpose::Disarm, ""));
  }

  return result;
}

TickResult EngagementController::abort(const std::string & reasonCode)
{
  TickResult result;
  primed_ = false;
  if (engaged()) {
    dropToSafe(EngagementEvent::Aborted, reasonCode, result);
  }
  return result;
}

CommandResultOutcome EngagementController::onCommandResult(
  const uint32_t requestId,
  const bool accepted)
{
  CommandResultOutcome outcome;
  const auto it = outstanding_.find(requestId);
  if (it == outstanding_.end()) {
    return outcome;
  }
  const OutstandingRequest request = it->second;
  outstanding_.erase(it);
  outcome.purpose = request.purpose;
  outcome.mode = request.mode;

  switch (request.purpose) {
    case CommandPurpose::Engage:
      // Local state never rolls back on a refused engage mode; overrides keep flowing.
      outcome.reasonCode = accepted ? "ENGAGE_MODE_ACCEPTED" : "ENGAGE_MODE_REJECTED";
      outcome.alert = !accepted;
      return outcome;
    case CommandPurpose::Disconnect:
      outcome.reasonCode = accepted ? "DISCONNECT_MODE_ACCEPTED" : "DISCONNECT_MODE_REJECTED";
      outcome.alert = !accepted;
      return outcome;
    case CommandPurpose::ReturnToLaunch:
      outcome.reasonCode = accepted ? "RTL_ACCEPTED" : "RTL_REJECTED";
      outcome.alert = !accepted;
      return outcome;
    case CommandPurpose::Disarm:
      outcome.reasonCode = accepted ? "DISARM_ACCEPTED" : "DISARM_REJECTED";
      outcome.alert = !accepted;
      return outcome;
    case CommandPurpose::Restore:
      break;
    default:
      return outcome;
  }

  // A newer engagement or disconnect supersedes the restore chain.
  if (!pendingRestore_.has_value() || pendingRestore_->requestId != requestId || engaged()) {
    return outcome;
  }

  if (accepted) {
    pendingRestore_.reset();
    outcome.reasonCode = "RESTORE_ACCEPTED";
    return outcome;
  }

  const std::optional<std::string> next = arbiter_.nextAfterRejection(
    request.mode, config_.fallbackChain, pendingRestore_->attempted);
  if (!next.has_value()) {
    pendingRestore_.reset();
    outcome.reasonCode = "NO_VIABLE_FALLBACK";
    outcome.alert = true;
    return outcome;
  }

  EngagementCommand command = makeRequest(
    CommandType::RequestMode, CommandPurpose::Restore, *next);
  pendingRestore_->requestId = command.requestId;
  pendingRestore_->attempted.push_back(*next);
  outcome.commands.push_back(command);
  outcome.reasonCode = "FALLBACK_REQUESTED";
  return outcome;
}

void EngagementController::engage(const TickInput & input, TickResult & result)
{
  const EngagementState from = state_;
  calibration_ = AxisCalibration::capture(input.axes);
  pendingRestore_.reset();

  if (config_.modeSwitchingEnabled) {
    arbiter_.capture(input.currentMode);
    result.commands.push_back(
      makeRequest(CommandType::RequestMode, CommandPurpose::Engage, config_.engageMode));
    state_ = EngagementState::Engaged;
    lastReason_ = "ENGAGED";
  } else {
    state_ = EngagementState::ManualOverrideOnly;
    lastReason_ = "ENGAGED_MANUAL_ONLY";
  }
  result.transition = EngagementTransition{from, state_, EngagementEvent::TriggerPressed,
    lastReason_};
}

void EngagementController::release(TickResult & result)
{
  const EngagementState from = state_;

  EngagementCommand releaseCommand;
  releaseCommand.type = CommandType::ReleaseOverride;
  releaseCommand.purpose = CommandPurpose::Override;
  releaseCommand.channels = ChannelOverride::released();
  result.commands.push_back(releaseCommand);

  if (config_.modeSwitchingEnabled) {
    const std::string snapshot = arbiter_.snapshot().value_or(std::string(kUnknownMode));
    const std::string target = arbiter_.resolve(snapshot, config_.fallbackChain);
    EngagementCommand restore = makeRequest(
      CommandType::RequestMode, CommandPurpose::Restore, target);
    PendingRestore pending;
    pending.requestId = restore.requestId;
    pending.attempted.push_back(target);
    pendingRestore_ = pending;
    result.commands.push_back(restore);
  }

  clearSession();
  state_ = EngagementState::Disengaged;
  lastReason_ = "RELEASED";
  result.transition = EngagementTransition{from, state_, EngagementEvent::TriggerReleased,
    lastReason_};
}

void EngagementController::dropToSafe(
  const EngagementEvent event,
  const std::string & reasonCode,
  TickResult & result)
{
  const EngagementState from = state_;

  EngagementCommand releaseCommand;
  releaseCommand.type = CommandType::ReleaseOverride;
  releaseCommand.purpose = CommandPurpose::Override;
  releaseCommand.channels = ChannelOverride::released();
  result.commands.push_back(releaseCommand);

  pendingRestore_.reset();
  if (config_.modeSwitchingEnabled) {
    result.commands.push_back(
      makeRequest(
        CommandType::RequestMode, CommandPurpose::Disconnect,
        config_.effectiveDisconnectMode()));
  }

  clearSession();
  state_ = EngagementState::Disengaged;
  lastReason_ = reasonCode;
  result.transition = EngagementTransition{from, state_, event, lastReason_};
}

void EngagementController::clearSession()
{
  calibration_.reset();
  arbiter_.clear();
  override_ = ChannelOverride::released();
}

EngagementCommand EngagementController::makeRequest(
  const CommandType type,
  const CommandPurpose purpose,
  const std::string & mode)
{
  EngagementCommand command;
  command.type = type;
  command.purpose = purpose;
  command.mode = mode.empty() ? mode : normalizeMode(mode);
  command.requestId = nextRequestId_++;
  if (nextRequestId_ == 0) {
    nextRequestId_ = 1;
  }

  outstanding_[command.requestId] = OutstandingRequest{purpose, command.mode};
  while (outstanding_.size() > kMaxOutstandingRequests) {
    outstanding_.erase(outstanding_.begin());
  }
  return command;
}

const char * EngagementController::toString(const EngagementState state)
{
  switch (state) {
    case EngagementState::Disengaged:
      return "DISENGAGED";
    case EngagementState::Engaged:
      return "ENGAGED";
    case EngagementState::ManualOverrideOnly:
      return "MANUAL_OVERRIDE_ONLY";
    default:
      return "UNKNOWN";
  }
}

const char * EngagementController::toString(const EngagementEvent event)
{
  switch (event) {
    case EngagementEvent::TriggerPressed:
      return "trigger_pressed";
    case EngagementEvent::TriggerReleased:
      return "trigger_released";
    case EngagementEvent::InputLost:
      return "input_lost";
    case EngagementEvent::Aborted:
      return "aborted";
    default:
      return "unknown_event";
  }
}

const char * EngagementController::toString(const CommandType type)
{
  switch (type) {
    case CommandType::SetOverride:
      return "set_override";
    case CommandType::ReleaseOverride:
      return "release_override";
    case CommandType::RequestMode:
      return "request_mode";
    case CommandType::ReturnToLaunch:
      return "return_to_launch";
    case CommandType::Disarm:
      return "disarm";
    default:
      return "unknown_command";
  }
}

const char * EngagementController::toString(const CommandPurpose purpose)
{
  switch (purpose) {
    case CommandPurpose::Override:
      return "override";
    case CommandPurpose::Engage:
      return "engage";
    case CommandPurpose::Restore:
      return "restore";
    case CommandPurpose::Disconnect:
      return "disconnect";
    case CommandPurpose::ReturnToLaunch:
      return "return_to_launch";
    case CommandPurpose::Disarm:
      return "disarm";
    default:
      return "unknown_purpose";
  }
}

}  // namespace engagement_manager
