#include <link_supervisor/link_command.hpp>

#include <stdexcept>

namespace link_supervisor
{

void LinkCommandConfig::validate() const
{
  if (relayExecutable.empty()) {
    throw std::invalid_argument("relay_executable must not be empty");
  }
  if (master.empty()) {
    throw std::invalid_argument("master must not be empty");
  }
  if (baud < 0) {
    throw std::invalid_argument("baud must be >= 0");
  }
  if (outputs.empty()) {
    throw std::invalid_argument("outputs must name at least one endpoint");
  }
  for (const auto & output : outputs) {
    if (output.empty()) {
      throw std::invalid_argument("outputs must not contain empty entries");
    }
  }
}

std::vector<std::string> buildLinkCommand(
  const LinkCommandConfig & config,
  const bool joystickEnabled,
  const bool diagnosticsEnabled)
{
  std::vector<std::string> argv;
  argv.push_back(config.relayExecutable);
  argv.push_back("--master=" + config.master);
  if (config.baud > 0) {
    argv.push_back("--baud=" + std::to_string(config.baud));
  }
  for (const auto & output : config.outputs) {
    argv.push_back("--out=" + output);
  }
  argv.insert(argv.end(), config.extraArgs.begin(), config.extraArgs.end());
  if (joystickEnabled) {
    argv.insert(argv.end(), config.joystickArgs.begin(), config.joystickArgs.end());
  }
  if (diagnosticsEnabled) {
    argv.insert(argv.end(), config.diagnosticArgs.begin(), config.diagnosticArgs.end());
  }
  return argv;
}

std::string joinCommand(const std::vector<std::string> & argv)
{
  std::string out;
  for (const auto & arg : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += arg;
  }
  return out;
}

}  // namespace link_supervisor
