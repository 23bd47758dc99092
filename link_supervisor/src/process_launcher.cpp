#include <link_supervisor/process_launcher.hpp>

namespace link_supervisor
{

std::string describe(const ProcessStatus & status)
{
  if (status.running) {
    return "running";
  }
  if (status.signaled) {
    return "signal " + std::to_string(status.signal);
  }
  if (status.exited) {
    return "exit code " + std::to_string(status.exitCode);
  }
  return "unknown exit";
}

}  // namespace link_supervisor
