#include <link_supervisor/link_supervisor.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace link_supervisor
{
namespace
{

std::string formatSeconds(const double seconds)
{
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << seconds;
  return out.str();
}

double secondsBetween(
  const LinkSupervisor::Clock::time_point from,
  const LinkSupervisor::Clock::time_point to)
{
  return std::chrono::duration<double>(to - from).count();
}

}  // namespace

void SupervisorConfig::validate() const
{
  backoff.validate();
  if (!(sustainedUptime_s > 0.0)) {
    throw std::invalid_argument("sustained_uptime_s must be > 0");
  }
  if (degradeAfterFailures == 0) {
    throw std::invalid_argument("degrade_after_failures must be >= 1");
  }
  if (diagnosticsAfterFailures == 0) {
    throw std::invalid_argument("diagnostics_after_failures must be >= 1");
  }
  if (alertAfterFailures == 0) {
    throw std::invalid_argument("alert_after_failures must be >= 1");
  }
  if (!(terminateGrace_s >= 0.0)) {
    throw std::invalid_argument("terminate_grace_s must be >= 0");
  }
  if (!(livenessTerminateGrace_s >= 0.0)) {
    throw std::invalid_argument("liveness_terminate_grace_s must be >= 0");
  }
}

LinkSupervisor::LinkSupervisor(
  SupervisorConfig config,
  LinkCommandConfig commandConfig,
  ProcessLauncher & launcher)
: config_(std::move(config)),
  commandConfig_(std::move(commandConfig)),
  launcher_(launcher)
{
  config_.validate();
  commandConfig_.validate();
}

LinkSupervisor::~LinkSupervisor()
{
  // Never leave an orphaned relay behind.
  if (childPid_ != 0) {
    (void)launcher_.terminate(childPid_, std::chrono::duration<double>(config_.terminateGrace_s));
    childPid_ = 0;
  }
}

std::vector<SupervisorRecord> LinkSupervisor::step(const Clock::time_point now)
{
  std::vector<SupervisorRecord> records;

  switch (state_) {
    case SupervisorState::Starting:
      startChild(now, records);
      break;

    case SupervisorState::Running:
    case SupervisorState::Degraded:
      {
        const ProcessStatus status = launcher_.poll(childPid_);
        const double uptime = secondsBetween(startedAt_, now);
        if (!uptimeCredited_ && uptime >= config_.sustainedUptime_s) {
          creditUptime(records);
        }
        if (!status.running) {
          const bool joystickFailure = joystickActive_ && status.exited &&
            status.exitCode == config_.joystickFailureExitCode;
          childPid_ = 0;
          handleExit(
            now, "PROCESS_EXITED", describe(status) + " after " + formatSeconds(uptime) + "s",
            joystickFailure, records);
        }
        break;
      }

    case SupervisorState::Backoff:
      if (now >= restartAt_) {
        // Counted before the start; only sustained uptime clears it.
        ++failures_;
        escalate(records);
        record(
          records, SupervisorState::Backoff, SupervisorState::Starting, "RESTART",
          "failures=" + std::to_string(failures_), RecordSeverity::Info);
        state_ = SupervisorState::Starting;
        startChild(now, records);
      }
      break;

    case SupervisorState::Stopped:
    default:
      break;
  }

  return records;
}

std::vector<SupervisorRecord> LinkSupervisor::reportLivenessLost(
  const Clock::time_point now,
  const std::string & detail)
{
  std::vector<SupervisorRecord> records;
  if (state_ != SupervisorState::Running && state_ != SupervisorState::Degraded) {
    return records;
  }

  if (!uptimeCredited_ && secondsBetween(startedAt_, now) >= config_.sustainedUptime_s) {
    creditUptime(records);
  }
  const ProcessStatus status = launcher_.terminate(
    childPid_, std::chrono::duration<double>(config_.livenessTerminateGrace_s));
  childPid_ = 0;
  handleExit(now, "LIVENESS_LOST", detail + "; child " + describe(status), false, records);
  return records;
}

std::vector<SupervisorRecord> LinkSupervisor::shutdown()
{
  std::vector<SupervisorRecord> records;
  if (state_ == SupervisorState::Stopped) {
    return records;
  }

  const SupervisorState from = state_;
  std::string detail = "no child running";
  if (childPid_ != 0) {
    const ProcessStatus status = launcher_.terminate(
      childPid_, std::chrono::duration<double>(config_.terminateGrace_s));
    detail = "child pid=" + std::to_string(childPid_) + " " + describe(status);
    childPid_ = 0;
  }
  joystickActive_ = false;
  state_ = SupervisorState::Stopped;
  record(records, from, state_, "SHUTDOWN", detail, RecordSeverity::Info);
  return records;
}

void LinkSupervisor::startChild(
  const Clock::time_point now,
  std::vector<SupervisorRecord> & records)
{
  lastCommand_ = buildLinkCommand(commandConfig_, joystickEnabled_, diagnostics_);
  const SpawnResult result = launcher_.spawn(lastCommand_);
  if (!result.success) {
    record(
      records, SupervisorState::Starting, SupervisorState::Backoff, "SPAWN_FAILED",
      result.detail, RecordSeverity::Error);
    enterBackoff(now, records);
    return;
  }

  childPid_ = result.pid;
  startedAt_ = now;
  uptimeCredited_ = false;
  joystickActive_ = joystickEnabled_ && !commandConfig_.joystickArgs.empty();
  backoff_s_ = 0.0;
  state_ = degraded_ ? SupervisorState::Degraded : SupervisorState::Running;
  record(
    records, SupervisorState::Starting, state_, "PROCESS_STARTED",
    "pid=" + std::to_string(childPid_) + " joystick=" + (joystickActive_ ? "on" : "off") +
    " diagnostics=" + (diagnostics_ ? "on" : "off") + " cmd=" + joinCommand(lastCommand_),
    RecordSeverity::Info);
}

void LinkSupervisor::handleExit(
  const Clock::time_point now,
  const std::string & reasonCode,
  const std::string & detail,
  const bool joystickFailure,
  std::vector<SupervisorRecord> & records)
{
  const SupervisorState from = state_;
  record(records, from, SupervisorState::Backoff, reasonCode, detail, RecordSeverity::Warning);

  if (joystickFailure) {
    failures_ = std::max(failures_, config_.degradeAfterFailures);
    joystickEnabled_ = false;
    if (!diagnostics_) {
      diagnostics_ = true;
      record(
        records, from, SupervisorState::Backoff, "DIAGNOSTICS_ENABLED",
        "joystick module failure", RecordSeverity::Info);
    }
    if (!degraded_) {
      degraded_ = true;
      record(
        records, from, SupervisorState::Backoff, "DEGRADED_ENTER",
        "joystick module reported failure (exit code " +
        std::to_string(config_.joystickFailureExitCode) + "); disabled for next start",
        RecordSeverity::Warning);
    }
  }

  joystickActive_ = false;
  enterBackoff(now, records);
}

void LinkSupervisor::creditUptime(std::vector<SupervisorRecord> & records)
{
  uptimeCredited_ = true;
  const bool hadFailures = failures_ > 0 || diagnostics_;
  failures_ = 0;
  diagnostics_ = false;
  alertRaised_ = false;

  if (degraded_) {
    // The running child keeps its arguments; the joystick module returns on the next start.
    degraded_ = false;
    joystickEnabled_ = true;
    const SupervisorState from = state_;
    state_ = SupervisorState::Running;
    record(
      records, from, state_, "DEGRADED_EXIT",
      "sustained uptime reached; joystick module re-enabled for next start",
      RecordSeverity::Info);
  } else if (hadFailures) {
    record(
      records, state_, state_, "FAILURES_CLEARED", "sustained uptime reached",
      RecordSeverity::Info);
  }
}

void LinkSupervisor::escalate(std::vector<SupervisorRecord> & records)
{
  const std::string count = "failures=" + std::to_string(failures_);
  if (failures_ >= config_.degradeAfterFailures && !degraded_) {
    degraded_ = true;
    joystickEnabled_ = false;
    record(
      records, state_, state_, "DEGRADED_ENTER",
      count + "; joystick module disabled for next start", RecordSeverity::Warning);
  }
  if (failures_ >= config_.diagnosticsAfterFailures && !diagnostics_) {
    diagnostics_ = true;
    record(records, state_, state_, "DIAGNOSTICS_ENABLED", count, RecordSeverity::Info);
  }
  if (degraded_ && failures_ >= config_.alertAfterFailures && !alertRaised_) {
    alertRaised_ = true;
    record(
      records, state_, state_, "OPERATIONAL_ALERT",
      count + " while degraded; link cannot be kept up", RecordSeverity::Error);
  }
}

void LinkSupervisor::enterBackoff(
  const Clock::time_point now,
  std::vector<SupervisorRecord> & records)
{
  const SupervisorState from = state_;
  backoff_s_ = config_.backoff.delayFor(failures_);
  restartAt_ = now + std::chrono::duration_cast<Clock::duration>(
    std::chrono::duration<double>(backoff_s_));
  state_ = SupervisorState::Backoff;
  record(
    records, from, state_, "RESTART_SCHEDULED",
    "backoff_s=" + formatSeconds(backoff_s_) + " failures=" + std::to_string(failures_),
    RecordSeverity::Info);
}

void LinkSupervisor::record(
  std::vector<SupervisorRecord> & records,
  const SupervisorState from,
  const SupervisorState to,
  const std::string & reasonCode,
  const std::string & detail,
  const RecordSeverity severity)
{
  records.push_back(SupervisorRecord{from, to, reasonCode, detail, severity});
}

const char * LinkSupervisor::toString(const SupervisorState state)
{
  switch (state) {
    case SupervisorState::Starting:
      return "STARTING";
    case SupervisorState::Running:
      return "RUNNING";
    case SupervisorState::Backoff:
      return "BACKOFF";
    case SupervisorState::Degraded:
      return "DEGRADED";
    case SupervisorState::Stopped:
      return "STOPPED";
    default:
      return "UNKNOWN";
  }
}

const char * LinkSupervisor::toString(const RecordSeverity severity)
{
  switch (severity) {
    case RecordSeverity::Info:
      return "INFO";
    case RecordSeverity::Warning:
      return "WARN";
    case RecordSeverity::Error:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

}  // namespace link_supervisor
