#pragma once

#include <string>
#include <vector>

namespace link_supervisor
{

/**
 * @struct LinkCommandConfig
 * @brief Relay command line pieces, assembled by buildLinkCommand().
 */
struct LinkCommandConfig
{
  std::string relayExecutable{"mavproxy.py"};
  std::string master{"/dev/ttyUSB0"};
  /// 0 omits --baud (network masters).
  int baud{115200};
  std::vector<std::string> outputs{"udp:127.0.0.1:14550"};
  std::vector<std::string> extraArgs;
  /// Relay-side bridge for rc_override; loaded only while joystick integration is enabled.
  std::vector<std::string> joystickArgs{"--load-module=joylink_bridge"};
  /// Added while diagnostics are escalated.
  std::vector<std::string> diagnosticArgs{"--show-errors"};

  void validate() const;
};

/**
 * Builds argv for one relay start:
 *
 *   <relay> --master=M [--baud=B] --out=O... [extra...] [joystick...] [diagnostic...]
 */
std::vector<std::string> buildLinkCommand(
  const LinkCommandConfig & config, bool joystickEnabled, bool diagnosticsEnabled);

/// Space-joined argv for logging.
std::string joinCommand(const std::vector<std::string> & argv);

}  // namespace link_supervisor
