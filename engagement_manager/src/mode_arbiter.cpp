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
#include <engagement_manager/mode_arbiter.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

namespace engagement_manager
{
namespace
{

bool contains(const std::vector<std::string> & modes, const std::string & mode)
{
  const std::string wanted = normalizeMode(mode);
  return std::any_of(
    modes.begin(), modes.end(),
    [&wanted](const std::string & candidate) {return normalizeMode(candidate) == wanted;});
}

}  // namespace

std::string normalizeMode(const std::string & mode)
{
  std::string out = mode;
  std::transform(
    out.begin(), out.end(), out.begin(),
    [](unsigned char c) {return static_cast<char>(std::toupper(c));});
  return out;
}

ModeArbiter::ModeArbiter(std::vector<std::string> excludedModes)
: excludedModes_(std::move(excludedModes))
{
}

void ModeArbiter::capture(const std::optional<std::string> & currentMode)
{
  if (currentMode.has_value() && !currentMode->empty()) {
    snapshot_ = normalizeMode(*currentMode);
  } else {
    snapshot_ = std::string(kUnknownMode);
  }
}

void ModeArbiter::clear()
{
  snapshot_.reset();
}

bool ModeArbiter::isExcluded(const std::string & mode) const
{
  if (mode.empty() || normalizeMode(mode) == kUnknownMode) {
    return true;
  }
  return contains(excludedModes_, mode);
}

std::string ModeArbiter::resolve(const std::string & snapshot, const FallbackChain & chain) const
{
  if (!isExcluded(snapshot)) {
    return normalizeMode(snapshot);
  }
  // Validated configuration guarantees a non-empty chain.
  return chain.empty() ? std::string() : normalizeMode(chain.front());
}

std::optional<std::string> ModeArbiter::nextAfterRejection(
  const std::string & rejected,
  const FallbackChain & chain,
  const std::vector<std::string> & attempted) const
{
  // Chain order always wins; only modes already requested are skipped.
  for (const std::string & candidate : chain) {
    if (normalizeMode(candidate) == normalizeMode(rejected) || contains(attempted, candidate)) {
      continue;
    }
    return normalizeMode(candidate);
  }
  return std::nullopt;
}

}  // namespace engagement_manager
