/**
 * @file link_supervisor.hpp
 * @brief Restart-with-backoff state machine for the MAVLink relay process.
 *
 *   Starting ──(spawned)──────────────> Running | Degraded
 *   Starting ──(spawn failed)─────────> Backoff
 *   Running | Degraded ──(exit/liveness)──> Backoff
 *   Backoff ──(delay elapsed)─────────> Starting (spawn in the same step)
 *   Degraded ──(sustained uptime)─────> Running
 *   any ──(shutdown)──────────────────> Stopped
 *
 * Failure accounting:
 *  - The cold start begins at zero failures. Every restart from Backoff counts one
 *    failure up front; only a run that reaches sustainedUptime_s clears the count.
 *  - Reaching degradeAfterFailures sets the degraded flag: later starts omit the
 *    joystick arguments. Reaching diagnosticsAfterFailures adds diagnostic arguments.
 *  - A child exiting with joystickFailureExitCode while the joystick module was
 *    loaded degrades immediately.
 *  - A sustained run clears the degraded flag but the joystick module only returns
 *    on the next start; the running child is left alone.
 *
 * The class never sleeps and never reads the clock: step() gets `now` from the
 * host timer and returns what happened as SupervisorRecords.
 */

#pragma once

#include <link_supervisor/backoff_policy.hpp>
#include <link_supervisor/link_command.hpp>
#include <link_supervisor/process_launcher.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace link_supervisor
{

enum class SupervisorState : uint8_t
{
  Starting,
  Running,
  Backoff,
  /// Child running with joystick integration disabled.
  Degraded,
  Stopped
};

enum class RecordSeverity : uint8_t
{
  Info,
  Warning,
  Error
};

struct SupervisorRecord
{
  SupervisorState from{SupervisorState::Starting};
  SupervisorState to{SupervisorState::Starting};
  std::string reasonCode;
  std::string detail;
  RecordSeverity severity{RecordSeverity::Info};
};

struct SupervisorConfig
{
  BackoffPolicy backoff;
  double sustainedUptime_s{120.0};
  uint32_t degradeAfterFailures{3};
  uint32_t diagnosticsAfterFailures{5};
  uint32_t alertAfterFailures{10};
  double terminateGrace_s{10.0};
  /// Grace for liveness kills, which block the supervisor wake while they wait.
  double livenessTerminateGrace_s{2.0};
  int joystickFailureExitCode{42};

  void validate() const;
};

class LinkSupervisor
{
public:
  using Clock = std::chrono::steady_clock;

  /// Validates both configs; `launcher` must outlive the supervisor.
  LinkSupervisor(
    SupervisorConfig config, LinkCommandConfig commandConfig, ProcessLauncher & launcher);
  ~LinkSupervisor();

  LinkSupervisor(const LinkSupervisor &) = delete;
  LinkSupervisor & operator=(const LinkSupervisor &) = delete;

  /// One supervisor wake: poll the child, credit uptime, restart after backoff.
  std::vector<SupervisorRecord> step(Clock::time_point now);

  /**
   * Kills the running child and schedules a restart.
   *
   * Blocks for up to livenessTerminateGrace_s while the child handles SIGTERM.
   */
  std::vector<SupervisorRecord> reportLivenessLost(Clock::time_point now, const std::string & detail);

  /// Stops restarting and terminates the child. Idempotent.
  std::vector<SupervisorRecord> shutdown();

  SupervisorState state() const {return state_;}
  uint32_t consecutiveFailures() const {return failures_;}
  bool degraded() const {return degraded_;}
  bool diagnosticsEnabled() const {return diagnostics_;}
  /// Whether the next start loads the joystick module.
  bool joystickEnabled() const {return joystickEnabled_;}
  /// Whether the running child was started with the joystick module.
  bool joystickActive() const {return joystickActive_;}
  bool childRunning() const {return childPid_ != 0;}
  int childPid() const {return childPid_;}
  Clock::time_point startedAt() const {return startedAt_;}
  /// Delay of the current (or latest) backoff.
  double currentBackoff_s() const {return backoff_s_;}
  Clock::time_point restartAt() const {return restartAt_;}
  /// argv of the latest spawn attempt.
  const std::vector<std::string> & lastCommand() const {return lastCommand_;}

  const SupervisorConfig & config() const {return config_;}

  static const char * toString(SupervisorState state);
  static const char * toString(RecordSeverity severity);

private:
  void startChild(Clock::time_point now, std::vector<SupervisorRecord> & records);
  void handleExit(
    Clock::time_point now, const std::string & reasonCode, const std::string & detail,
    bool joystickFailure, std::vector<SupervisorRecord> & records);
  void creditUptime(std::vector<SupervisorRecord> & records);
  void escalate(std::vector<SupervisorRecord> & records);
  void enterBackoff(
    Clock::time_point now, std::vector<SupervisorRecord> & records);
  void record(
    std::vector<SupervisorRecord> & records, SupervisorState from, SupervisorState to,
    const std::string & reasonCode, const std::string & detail, RecordSeverity severity);

  SupervisorConfig config_;
  LinkCommandConfig commandConfig_;
  ProcessLauncher & launcher_;

  SupervisorState state_{SupervisorState::Starting};
  uint32_t failures_{0};
  bool degraded_{false};
  bool diagnostics_{false};
  bool joystickEnabled_{true};
  bool joystickActive_{false};
  bool alertRaised_{false};
  bool uptimeCredited_{false};

  int childPid_{0};
  Clock::time_point startedAt_{};
  Clock::time_point restartAt_{};
  double backoff_s_{0.0};
  std::vector<std::string> lastCommand_;
};

}  // namespace link_supervisor
