/**
 * @file test_link_supervisor.cpp
 * @brief Restart/backoff/degrade behaviour of LinkSupervisor against a fake launcher.
 *
 * Time is injected: each test walks a steady_clock time_point forward by hand, so
 * backoff expiry and sustained uptime are exact.
 */

#include <gtest/gtest.h>

#include <link_supervisor/link_supervisor.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

using link_supervisor::LinkSupervisor;
using link_supervisor::SupervisorRecord;
using link_supervisor::SupervisorState;
using Clock = LinkSupervisor::Clock;
using std::chrono::seconds;

class FakeLauncher : public link_supervisor::ProcessLauncher
{
public:
  link_supervisor::SpawnResult spawn(const std::vector<std::string> & argv) override
  {
    spawns.push_back(argv);
    link_supervisor::SpawnResult result;
    if (failSpawn) {
      result.detail = "exec mavproxy.py failed: No such file or directory";
      return result;
    }
    running = true;
    result.success = true;
    result.pid = nextPid++;
    return result;
  }

  link_supervisor::ProcessStatus poll(int) override
  {
    link_supervisor::ProcessStatus status;
    status.running = running;
    if (!running) {
      status.exited = true;
      status.exitCode = exitCode;
    }
    return status;
  }

  link_supervisor::ProcessStatus terminate(int, std::chrono::duration<double> grace) override
  {
    ++terminateCalls;
    lastGrace_s = grace.count();
    running = false;
    link_supervisor::ProcessStatus status;
    status.signaled = true;
    status.signal = 15;
    return status;
  }

  void exitWith(int code)
  {
    running = false;
    exitCode = code;
  }

  std::vector<std::vector<std::string>> spawns;
  bool failSpawn{false};
  bool running{false};
  int exitCode{0};
  int nextPid{100};
  int terminateCalls{0};
  double lastGrace_s{0.0};
};

bool hasArg(const std::vector<std::string> & argv, const std::string & arg)
{
  return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

std::size_t countReason(const std::vector<SupervisorRecord> & records, const std::string & reason)
{
  return static_cast<std::size_t>(std::count_if(
           records.begin(), records.end(),
           [&reason](const SupervisorRecord & record) {return record.reasonCode == reason;}));
}

link_supervisor::SupervisorConfig fastConfig()
{
  link_supervisor::SupervisorConfig config;
  config.backoff.initial_s = 1.0;
  config.backoff.multiplier = 1.0;
  config.backoff.max_s = 1.0;
  return config;
}

// Child exits, backoff elapses, child restarts. Returns all records produced.
std::vector<SupervisorRecord> crashAndRestart(
  LinkSupervisor & supervisor, FakeLauncher & launcher, Clock::time_point & now, int code = 1)
{
  std::vector<SupervisorRecord> all;
  launcher.exitWith(code);
  now += seconds(1);
  auto records = supervisor.step(now);
  all.insert(all.end(), records.begin(), records.end());
  EXPECT_EQ(supervisor.state(), SupervisorState::Backoff);
  now += seconds(1);
  records = supervisor.step(now);
  all.insert(all.end(), records.begin(), records.end());
  return all;
}

}  // namespace

TEST(LinkSupervisorTest, ColdStartSpawnsWithJoystick)
{
  FakeLauncher launcher;
  LinkSupervisor supervisor(fastConfig(), link_supervisor::LinkCommandConfig{}, launcher);
  EXPECT_EQ(supervisor.state(), SupervisorState::Starting);

  const auto records = supervisor.step(Clock::time_point{});
  EXPECT_EQ(supervisor.state(), SupervisorState::Running);
  EXPECT_EQ(supervisor.consecutiveFailures(), 0u);
  ASSERT_EQ(launcher.spawns.size(), 1u);
  EXPECT_TRUE(hasArg(launcher.spawns[0], "--load-module=joylink_bridge"));
  EXPECT_FALSE(hasArg(launcher.spawns[0], "--show-errors"));
  EXPECT_TRUE(supervisor.joystickActive());
  EXPECT_EQ(countReason(records, "PROCESS_STARTED"), 1u);
}

TEST(LinkSupervisorTest, ExitSchedulesRestartAfterBackoff)
{
  FakeLauncher launcher;
  LinkSupervisor supervisor(
    link_supervisor::SupervisorConfig{}, link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};
  supervisor.step(now);

  launcher.exitWith(1);
  now += seconds(3);
  const auto records = supervisor.step(now);
  EXPECT_EQ(supervisor.state(), SupervisorState::Backoff);
  EXPECT_EQ(countReason(records, "PROCESS_EXITED"), 1u);
  EXPECT_EQ(countReason(records, "RESTART_SCHEDULED"), 1u);
  EXPECT_DOUBLE_EQ(supervisor.currentBackoff_s(), 5.0);

  // Not yet.
  now += seconds(4);
  EXPECT_TRUE(supervisor.step(now).empty());
  EXPECT_EQ(launcher.spawns.size(), 1u);

  now += seconds(1);
  supervisor.step(now);
  EXPECT_EQ(supervisor.state(), SupervisorState::Running);
  EXPECT_EQ(supervisor.consecutiveFailures(), 1u);
  EXPECT_EQ(launcher.spawns.size(), 2u);

  // Second consecutive exit waits longer.
  launcher.exitWith(1);
  now += seconds(1);
  supervisor.step(now);
  EXPECT_DOUBLE_EQ(supervisor.currentBackoff_s(), 10.0);
}

TEST(LinkSupervisorTest, FiveExitsDegradeAndDropJoystick)
{
  FakeLauncher launcher;
  LinkSupervisor supervisor(fastConfig(), link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};
  supervisor.step(now);

  std::vector<SupervisorRecord> all;
  for (int i = 0; i < 5; ++i) {
    const auto records = crashAndRestart(supervisor, launcher, now);
    all.insert(all.end(), records.begin(), records.end());
  }

  EXPECT_EQ(supervisor.state(), SupervisorState::Degraded);
  EXPECT_TRUE(supervisor.degraded());
  EXPECT_TRUE(supervisor.diagnosticsEnabled());
  EXPECT_FALSE(supervisor.joystickEnabled());
  EXPECT_EQ(supervisor.consecutiveFailures(), 5u);
  EXPECT_EQ(countReason(all, "DEGRADED_ENTER"), 1u);
  EXPECT_EQ(countReason(all, "DIAGNOSTICS_ENABLED"), 1u);

  ASSERT_EQ(launcher.spawns.size(), 6u);
  // Restarts 1-2 keep the joystick module; from the third restart on it is gone.
  EXPECT_TRUE(hasArg(launcher.spawns[2], "--load-module=joylink_bridge"));
  EXPECT_FALSE(hasArg(launcher.spawns[3], "--load-module=joylink_bridge"));
  EXPECT_FALSE(hasArg(launcher.spawns[5], "--load-module=joylink_bridge"));
  EXPECT_FALSE(hasArg(launcher.spawns[4], "--show-errors"));
  EXPECT_TRUE(hasArg(launcher.spawns[5], "--show-errors"));
}

TEST(LinkSupervisorTest, SustainedUptimeClearsDegradeOnNextStart)
{
  FakeLauncher launcher;
  LinkSupervisor supervisor(fastConfig(), link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};
  supervisor.step(now);
  for (int i = 0; i < 3; ++i) {
    crashAndRestart(supervisor, launcher, now);
  }
  ASSERT_EQ(supervisor.state(), SupervisorState::Degraded);
  const auto spawnsBefore = launcher.spawns.size();

  now += seconds(120);
  const auto records = supervisor.step(now);
  EXPECT_EQ(countReason(records, "DEGRADED_EXIT"), 1u);
  EXPECT_EQ(supervisor.state(), SupervisorState::Running);
  EXPECT_FALSE(supervisor.degraded());
  EXPECT_EQ(supervisor.consecutiveFailures(), 0u);
  EXPECT_TRUE(supervisor.joystickEnabled());
  // The running child is not restarted to pick the module back up.
  EXPECT_FALSE(supervisor.joystickActive());
  EXPECT_EQ(launcher.spawns.size(), spawnsBefore);
  EXPECT_EQ(launcher.terminateCalls, 0);

  crashAndRestart(supervisor, launcher, now);
  EXPECT_TRUE(hasArg(launcher.spawns.back(), "--load-module=joylink_bridge"));
  EXPECT_EQ(supervisor.consecutiveFailures(), 1u);
}

TEST(LinkSupervisorTest, JoystickFailureExitDegradesImmediately)
{
  FakeLauncher launcher;
  LinkSupervisor supervisor(fastConfig(), link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};
  supervisor.step(now);

  const auto records = crashAndRestart(supervisor, launcher, now, 42);
  EXPECT_EQ(countReason(records, "DEGRADED_ENTER"), 1u);
  EXPECT_EQ(supervisor.state(), SupervisorState::Degraded);
  EXPECT_TRUE(supervisor.diagnosticsEnabled());
  EXPECT_GE(supervisor.consecutiveFailures(), 3u);
  EXPECT_FALSE(hasArg(launcher.spawns.back(), "--load-module=joylink_bridge"));
  EXPECT_TRUE(hasArg(launcher.spawns.back(), "--show-errors"));
}

// Exit code 42 from a child started without the module is an ordinary failure.
TEST(LinkSupervisorTest, JoystickFailureCodeIgnoredWithoutModule)
{
  FakeLauncher launcher;
  auto config = fastConfig();
  config.diagnosticsAfterFailures = 10;
  LinkSupervisor supervisor(config, link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};
  supervisor.step(now);
  for (int i = 0; i < 3; ++i) {
    crashAndRestart(supervisor, launcher, now);
  }
  ASSERT_TRUE(supervisor.degraded());
  ASSERT_FALSE(supervisor.joystickActive());

  const auto records = crashAndRestart(supervisor, launcher, now, 42);
  EXPECT_EQ(countReason(records, "DIAGNOSTICS_ENABLED"), 0u);
  EXPECT_FALSE(supervisor.diagnosticsEnabled());
  EXPECT_EQ(supervisor.consecutiveFailures(), 4u);
}

TEST(LinkSupervisorTest, SpawnFailureBacksOffAndAlertsOnce)
{
  FakeLauncher launcher;
  launcher.failSpawn = true;
  auto config = fastConfig();
  config.degradeAfterFailures = 2;
  config.alertAfterFailures = 4;
  LinkSupervisor supervisor(config, link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};

  auto records = supervisor.step(now);
  EXPECT_EQ(supervisor.state(), SupervisorState::Backoff);
  ASSERT_EQ(countReason(records, "SPAWN_FAILED"), 1u);
  EXPECT_EQ(records.front().severity, link_supervisor::RecordSeverity::Error);
  EXPECT_FALSE(supervisor.childRunning());

  std::vector<SupervisorRecord> all;
  for (int i = 0; i < 8; ++i) {
    now += seconds(1);
    records = supervisor.step(now);
    all.insert(all.end(), records.begin(), records.end());
    EXPECT_EQ(supervisor.state(), SupervisorState::Backoff);
  }
  EXPECT_EQ(supervisor.consecutiveFailures(), 8u);
  EXPECT_EQ(countReason(all, "OPERATIONAL_ALERT"), 1u);
  EXPECT_EQ(countReason(all, "SPAWN_FAILED"), 8u);

  // Recovery to a running child.
  launcher.failSpawn = false;
  now += seconds(1);
  supervisor.step(now);
  EXPECT_EQ(supervisor.state(), SupervisorState::Degraded);
}

TEST(LinkSupervisorTest, LivenessLossTerminatesAndRestarts)
{
  FakeLauncher launcher;
  LinkSupervisor supervisor(fastConfig(), link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};
  supervisor.step(now);

  now += seconds(5);
  const auto records = supervisor.reportLivenessLost(now, "no vehicle_status for 5s");
  EXPECT_EQ(countReason(records, "LIVENESS_LOST"), 1u);
  EXPECT_EQ(launcher.terminateCalls, 1);
  // Liveness kills use the short grace; shutdown keeps terminate_grace_s.
  EXPECT_DOUBLE_EQ(launcher.lastGrace_s, 2.0);
  EXPECT_EQ(supervisor.state(), SupervisorState::Backoff);

  // Already down: nothing to kill.
  EXPECT_TRUE(supervisor.reportLivenessLost(now, "again").empty());

  now += seconds(1);
  supervisor.step(now);
  EXPECT_EQ(supervisor.state(), SupervisorState::Running);
  EXPECT_EQ(launcher.spawns.size(), 2u);
}

TEST(LinkSupervisorTest, ShutdownTerminatesChildOnce)
{
  FakeLauncher launcher;
  LinkSupervisor supervisor(fastConfig(), link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};
  supervisor.step(now);

  const auto records = supervisor.shutdown();
  EXPECT_EQ(supervisor.state(), SupervisorState::Stopped);
  EXPECT_EQ(countReason(records, "SHUTDOWN"), 1u);
  EXPECT_EQ(launcher.terminateCalls, 1);
  EXPECT_DOUBLE_EQ(launcher.lastGrace_s, 10.0);
  EXPECT_FALSE(supervisor.childRunning());

  EXPECT_TRUE(supervisor.shutdown().empty());
  now += seconds(60);
  EXPECT_TRUE(supervisor.step(now).empty());
  EXPECT_EQ(launcher.spawns.size(), 1u);
  EXPECT_EQ(launcher.terminateCalls, 1);
}

TEST(LinkSupervisorTest, ShutdownDuringBackoffSpawnsNothing)
{
  FakeLauncher launcher;
  LinkSupervisor supervisor(fastConfig(), link_supervisor::LinkCommandConfig{}, launcher);
  Clock::time_point now{};
  supervisor.step(now);
  launcher.exitWith(1);
  supervisor.step(now);
  ASSERT_EQ(supervisor.state(), SupervisorState::Backoff);

  supervisor.shutdown();
  EXPECT_EQ(launcher.terminateCalls, 0);
  now += seconds(10);
  supervisor.step(now);
  EXPECT_EQ(launcher.spawns.size(), 1u);
}

TEST(LinkSupervisorTest, RejectsInvalidConfig)
{
  FakeLauncher launcher;
  auto badBackoff = fastConfig();
  badBackoff.backoff.multiplier = 0.5;
  EXPECT_THROW(
    LinkSupervisor(badBackoff, link_supervisor::LinkCommandConfig{}, launcher),
    std::invalid_argument);

  auto badThreshold = fastConfig();
  badThreshold.degradeAfterFailures = 0;
  EXPECT_THROW(
    LinkSupervisor(badThreshold, link_supervisor::LinkCommandConfig{}, launcher),
    std::invalid_argument);

  auto badGrace = fastConfig();
  badGrace.livenessTerminateGrace_s = -1.0;
  EXPECT_THROW(
    LinkSupervisor(badGrace, link_supervisor::LinkCommandConfig{}, launcher),
    std::invalid_argument);

  link_supervisor::LinkCommandConfig noOutputs;
  noOutputs.outputs.clear();
  EXPECT_THROW(LinkSupervisor(fastConfig(), noOutputs, launcher), std::invalid_argument);
  EXPECT_TRUE(launcher.spawns.empty());
}
