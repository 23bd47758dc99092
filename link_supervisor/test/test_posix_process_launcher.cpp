#include <gtest/gtest.h>

#include <link_supervisor/event_journal.hpp>
#include <link_supervisor/posix_process_launcher.hpp>

#include <signal.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>

namespace
{

// Polls until the child is gone or `timeout` passes.
link_supervisor::ProcessStatus waitForExit(
  link_supervisor::ProcessLauncher & launcher, int pid,
  std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  link_supervisor::ProcessStatus status = launcher.poll(pid);
  while (status.running && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    status = launcher.poll(pid);
  }
  return status;
}

}  // namespace

TEST(PosixProcessLauncherTest, ReportsExitCode)
{
  link_supervisor::PosixProcessLauncher launcher;
  const auto spawned = launcher.spawn({"/bin/sh", "-c", "exit 3"});
  ASSERT_TRUE(spawned.success) << spawned.detail;
  ASSERT_GT(spawned.pid, 0);

  const auto status = waitForExit(launcher, spawned.pid);
  EXPECT_FALSE(status.running);
  EXPECT_TRUE(status.exited);
  EXPECT_EQ(status.exitCode, 3);
  EXPECT_EQ(link_supervisor::describe(status), "exit code 3");
}

TEST(PosixProcessLauncherTest, MissingExecutableFailsSynchronously)
{
  link_supervisor::PosixProcessLauncher launcher;
  const auto spawned = launcher.spawn({"/nonexistent/joylink-relay", "--master=x"});
  EXPECT_FALSE(spawned.success);
  EXPECT_NE(spawned.detail.find("/nonexistent/joylink-relay"), std::string::npos);

  EXPECT_FALSE(launcher.spawn({}).success);
}

TEST(PosixProcessLauncherTest, TerminateStopsChildWithinGrace)
{
  link_supervisor::PosixProcessLauncher launcher;
  const auto spawned = launcher.spawn({"/bin/sh", "-c", "sleep 30"});
  ASSERT_TRUE(spawned.success) << spawned.detail;
  EXPECT_TRUE(launcher.poll(spawned.pid).running);

  const auto started = std::chrono::steady_clock::now();
  const auto status = launcher.terminate(spawned.pid, std::chrono::duration<double>(5.0));
  EXPECT_FALSE(status.running);
  EXPECT_TRUE(status.signaled);
  EXPECT_EQ(status.signal, SIGTERM);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(PosixProcessLauncherTest, TerminateForceKillsAfterGrace)
{
  link_supervisor::PosixProcessLauncher launcher;
  const auto spawned = launcher.spawn({"/bin/sh", "-c", "trap '' TERM; sleep 30"});
  ASSERT_TRUE(spawned.success) << spawned.detail;
  // Let the shell install its trap before signalling.
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  const auto status = launcher.terminate(spawned.pid, std::chrono::duration<double>(0.3));
  EXPECT_FALSE(status.running);
  EXPECT_TRUE(status.signaled);
  EXPECT_EQ(status.signal, SIGKILL);
}

TEST(EventJournalTest, FormatsUtcTimestamp)
{
  const auto when = std::chrono::system_clock::from_time_t(1741168800);
  EXPECT_EQ(link_supervisor::EventJournal::formatTimestamp(when), "2025-03-05T10:00:00Z");
}

TEST(EventJournalTest, AppendsTimestampedLines)
{
  const std::string path = ::testing::TempDir() + "joylink_event_journal_test.log";
  std::remove(path.c_str());

  link_supervisor::EventJournal journal;
  std::string error;
  ASSERT_TRUE(journal.open(path, error)) << error;
  const auto when = std::chrono::system_clock::from_time_t(1741168800);
  EXPECT_TRUE(journal.append("INFO reason=PROCESS_STARTED", when));
  EXPECT_TRUE(journal.append("WARN reason=PROCESS_EXITED", when));
  journal.close();
  EXPECT_FALSE(journal.isOpen());
  EXPECT_FALSE(journal.append("dropped", when));

  std::ifstream in(path);
  std::string line;
  ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
  EXPECT_EQ(line, "[2025-03-05T10:00:00Z] INFO reason=PROCESS_STARTED");
  ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
  EXPECT_EQ(line, "[2025-03-05T10:00:00Z] WARN reason=PROCESS_EXITED");
  EXPECT_FALSE(static_cast<bool>(std::getline(in, line)));
  std::remove(path.c_str());
}

TEST(EventJournalTest, OpenFailureIsReported)
{
  link_supervisor::EventJournal journal;
  std::string error;
  EXPECT_FALSE(journal.open("/nonexistent-dir/joylink.log", error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(journal.isOpen());
}
