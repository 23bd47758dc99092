#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace link_supervisor
{

struct SpawnResult
{
  bool success{false};
  int pid{0};
  /// Failure reason when success is false.
  std::string detail;
};

struct ProcessStatus
{
  bool running{false};
  /// Valid when the child exited normally.
  bool exited{false};
  int exitCode{0};
  /// Valid when the child was killed by a signal.
  bool signaled{false};
  int signal{0};
};

/// Human-readable exit description ("exit code 1", "signal 9", "running").
std::string describe(const ProcessStatus & status);

/**
 * Child-process seam used by LinkSupervisor. The supervisor is the only caller
 * and owns every pid it gets back.
 */
class ProcessLauncher
{
public:
  virtual ~ProcessLauncher() = default;

  virtual SpawnResult spawn(const std::vector<std::string> & argv) = 0;

  /// Non-blocking. Once a non-running status is returned the pid is reaped.
  virtual ProcessStatus poll(int pid) = 0;

  /// Asks the child to stop, waits up to `grace`, then force-kills. Blocks until reaped.
  virtual ProcessStatus terminate(int pid, std::chrono::duration<double> grace) = 0;
};

}  // namespace link_supervisor
