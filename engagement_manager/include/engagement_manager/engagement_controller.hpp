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
 * @file engagement_controller.hpp
 * @brief Trigger/button state machine that turns operator intent into commands.
 *
 *   Disengaged ──(trigger pressed, mode switching on)──> Engaged
 *   Disengaged ──(trigger pressed, manual-only)───────> ManualOverrideOnly
 *   Engaged / ManualOverrideOnly ──(trigger released)──> Disengaged
 *   Engaged / ManualOverrideOnly ──(input lost)────────> Disengaged
 *
 * Design:
 *  - tick() is the whole interface to the host loop: it takes one TickInput and
 *    returns the commands to dispatch. It never blocks and never waits for a
 *    command to be acknowledged.
 *  - Buttons are edge-triggered. The first connected tick after (re)connection only
 *    latches button levels, so a trigger already held at connect time does nothing
 *    until it is released and pressed again.
 *  - While engaged, a full four-channel override is emitted on every tick; the
 *    vehicle drops overrides that stop arriving.
 *  - Release and input loss always emit an explicit ReleaseOverride. Local state
 *    follows operator intent, never vehicle acknowledgement.
 *  - Command results come back through onCommandResult(). Only a rejected restore
 *    leads to another request (the next fallback entry); everything else is
 *    reported, not retried.
 */

#pragma once

#include <engagement_manager/axis_calibration.hpp>
#include <engagement_manager/mode_arbiter.hpp>
#include <engagement_manager/rc_override_encoder.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace engagement_manager
{

/**
 * @enum EngagementState
 * @brief Exactly one is active; owned by EngagementController.
 */
enum class EngagementState : uint8_t
{
  Disengaged,
  /// Overrides flowing and the augmented-control mode requested.
  Engaged,
  /// Overrides flowing, vehicle mode left untouched (mode switching disabled).
  ManualOverrideOnly
};

/**
 * @enum EngagementEvent
 * @brief Events that move the state machine.
 */
enum class EngagementEvent : uint8_t
{
  TriggerPressed,
  TriggerReleased,
  InputLost,
  /// Host-side teardown (node deactivate/shutdown).
  Aborted
};

/**
 * @enum CommandType
 * @brief Outbound intents for the command relay.
 */
enum class CommandType : uint8_t
{
  SetOverride,
  ReleaseOverride,
  RequestMode,
  ReturnToLaunch,
  Disarm
};

/**
 * @enum CommandPurpose
 * @brief Why a relay request was issued; selects how its result is handled.
 */
enum class CommandPurpose : uint8_t
{
  Override,
  Engage,
  Restore,
  Disconnect,
  ReturnToLaunch,
  Disarm
};

/**
 * @struct EngagementCommand
 * @brief One outbound intent. Only the fields relevant to `type` are meaningful.
 */
struct EngagementCommand
{
  CommandType type{CommandType::ReleaseOverride};
  CommandPurpose purpose{CommandPurpose::Override};
  /// SetOverride payload (ReleaseOverride carries an all-released value).
  ChannelOverride channels;
  /// Target mode for RequestMode / ReturnToLaunch.
  std::string mode;
  /// Correlates an asynchronous result; 0 for override commands.
  uint32_t requestId{0};
};

/**
 * @struct TickInput
 * @brief Everything the controller reads from the host in one poll.
 */
struct TickInput
{
  /// False when the input source is gone (device removed, frames stale or malformed).
  bool connected{false};
  AxisSample axes;
  bool trigger{false};
  bool rtl{false};
  bool disarm{false};
  /// Vehicle mode as last reported by the relay; nullopt when unknown.
  std::optional<std::string> currentMode;
};

/**
 * @struct EngagementTransition
 * @brief Transition record for logging and status.
 */
struct EngagementTransition
{
  EngagementState from{EngagementState::Disengaged};
  EngagementState to{EngagementState::Disengaged};
  EngagementEvent event{EngagementEvent::TriggerPressed};
  std::string reasonCode;
};

/**
 * @struct TickResult
 * @brief Commands to dispatch this tick, in order, plus the transition taken (if any).
 */
struct TickResult
{
  std::vector<EngagementCommand> commands;
  std::optional<EngagementTransition> transition;
};

/**
 * @struct CommandResultOutcome
 * @brief Interpretation of one asynchronous relay result.
 */
struct CommandResultOutcome
{
  CommandPurpose purpose{CommandPurpose::Override};
  std::string mode;
  std::string reasonCode{"STALE_RESULT"};
  /// Follow-up requests (at most one fallback RequestMode).
  std::vector<EngagementCommand> commands;
  /// True when the fault needs operator attention.
  bool alert{false};
};

/**
 * @struct EngagementConfig
 * @brief Validated once at startup; immutable afterwards.
 */
struct EngagementConfig
{
  /// False selects manual-only operation (no mode requests at all).
  bool modeSwitchingEnabled{true};
  /// Augmented-control mode requested on engage.
  std::string engageMode{"GUIDED"};
  FallbackChain fallbackChain{"LOITER", "STABILIZE"};
  /// Mode requested on input loss; empty means fallbackChain.back().
  std::string disconnectMode;
  /// Mode that carries Return-to-Launch.
  std::string rtlMode{"RTL"};
  /// Snapshot values never restored on disengage.
  std::vector<std::string> excludedRestoreModes;
  EncoderConfig encoder;

  /// Throws std::invalid_argument on the first unusable field.
  void validate() const;
  /// Disconnect target after applying the fallback default.
  std::string effectiveDisconnectMode() const;
};

/**
 * @class EngagementController
 * @brief Owns calibration, snapshot and override state for one joystick session.
 */
class EngagementController
{
public:
  explicit EngagementController(EngagementConfig config);

  /// Runs one cooperative tick.
  TickResult tick(const TickInput & input);

  /**
   * @brief Forces Disengaged from any state, as for input loss.
   *
   * Used when the host stops ticking (deactivate/shutdown).
   */
  TickResult abort(const std::string & reasonCode);

  /**
   * @brief Applies the host's joystick-integration flag.
   *
   * Only takes effect while disengaged, so a running session is never torn.
   * While disabled, tick() emits nothing and buttons are not latched.
   * Returns false when the flag could not be applied.
   */
  bool setIntegrationEnabled(bool enabled);
  bool integrationEnabled() const {return integrationEnabled_;}

  /// Feeds back the relay's answer for `requestId`.
  CommandResultOutcome onCommandResult(uint32_t requestId, bool accepted);

  EngagementState state() const {return state_;}
  bool engaged() const {return state_ != EngagementState::Disengaged;}
  /// Present exactly while engaged.
  const std::optional<AxisCalibration> & calibration() const {return calibration_;}
  /// Override emitted on the latest tick; all released while disengaged.
  const ChannelOverride & currentOverride() const {return override_;}
  const ModeArbiter & arbiter() const {return arbiter_;}
  const EngagementConfig & config() const {return config_;}
  /// Reason code of the latest transition ("BOOT" before any).
  const std::string & lastReason() const {return lastReason_;}

  static const char * toString(EngagementState state);
  static const char * toString(EngagementEvent event);
  static const char * toString(CommandType type);
  static const char * toString(CommandPurpose purpose);

private:
  struct OutstandingRequest
  {
    CommandPurpose purpose;
    std::string mode;
  };

  /// Restore chain in progress for the latest disengage.
  struct PendingRestore
  {
    uint32_t requestId{0};
    std::vector<std::string> attempted;
  };

  void engage(const TickInput & input, TickResult & result);
  void release(TickResult & result);
  void dropToSafe(EngagementEvent event, const std::string & reasonCode, TickResult & result);
  void clearSession();

  EngagementCommand makeRequest(CommandType type, CommandPurpose purpose, const std::string & mode);

  EngagementConfig config_;
  RcOverrideEncoder encoder_;
  ModeArbiter arbiter_;

  EngagementState state_{EngagementState::Disengaged};
  std::optional<AxisCalibration> calibration_;
  ChannelOverride override_;
  std::string lastReason_{"BOOT"};

  bool integrationEnabled_{true};

  /// Button levels seen on the previous connected tick.
  bool primed_{false};
  bool prevTrigger_{false};
  bool prevRtl_{false};
  bool prevDisarm_{false};

  uint32_t nextRequestId_{1};
  std::map<uint32_t, OutstandingRequest> outstanding_;
  std::optional<PendingRestore> pendingRestore_;
};

}  // namespace engagement_manager
