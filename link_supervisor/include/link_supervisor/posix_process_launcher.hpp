#pragma once

#include <link_supervisor/process_launcher.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace link_supervisor
{

/**
 * fork/execvp launcher. Each child leads its own process group so terminate()
 * also reaches processes the relay starts. Exec failures are reported back
 * through a close-on-exec pipe, so spawn() fails synchronously when the
 * executable cannot be started.
 */
class PosixProcessLauncher : public ProcessLauncher
{
public:
  explicit PosixProcessLauncher(
    std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));

  SpawnResult spawn(const std::vector<std::string> & argv) override;
  ProcessStatus poll(int pid) override;
  ProcessStatus terminate(int pid, std::chrono::duration<double> grace) override;

private:
  bool signalGroup(int pid, int sig) const;

  std::chrono::milliseconds pollInterval_;
};

}  // namespace link_supervisor
