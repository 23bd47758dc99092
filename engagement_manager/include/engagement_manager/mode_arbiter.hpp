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
/**
 * @file mode_arbiter.hpp
 * @brief Previous-mode snapshot and restore/fallback resolution for disengage.
 *
 * Resolution order on disengage:
 *
 *   snapshot known and not excluded ──> snapshot
 *   otherwise                        ──> fallback[0]
 *
 * and, when a restore request comes back rejected:
 *
 *   snapshot rejected   ──> fallback[0]
 *   fallback[i] rejected ──> fallback[i + 1]
 *   last entry rejected  ──> nothing left (caller reports NO_VIABLE_FALLBACK)
 *
 * The arbiter only advises; it never issues commands and never clears itself. The
 * EngagementController owns when the snapshot is captured and cleared.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace engagement_manager
{

/// Snapshot value stored when the vehicle mode could not be read.
constexpr char kUnknownMode[] = "UNKNOWN";

/// Ordered candidate modes, primary-safe first and ultimate-safe last.
using FallbackChain = std::vector<std::string>;

/**
 * @class ModeArbiter
 * @brief Holds one ModeSnapshot slot and resolves the disengage target.
 */
class ModeArbiter
{
public:
  /**
   * @param excludedModes Snapshot values that must never be restored
   *        (compared case-insensitively).
   */
  explicit ModeArbiter(std::vector<std::string> excludedModes = {});

  /// Stores `currentMode`, or kUnknownMode when it is nullopt/empty. Overwrites.
  void capture(const std::optional<std::string> & currentMode);
  /// Empties the snapshot slot.
  void clear();
  /// Current snapshot, nullopt when the slot is empty.
  const std::optional<std::string> & snapshot() const {return snapshot_;}

  /// Mode to command on disengage for `snapshot` and `chain`.
  std::string resolve(const std::string & snapshot, const FallbackChain & chain) const;

  /**
   * @brief Next candidate after `rejected` was refused by the vehicle.
   *
   * The chain is scanned from its first entry. `rejected` and every mode in
   * `attempted` (already requested during this disengage) are skipped, so each
   * mode is tried at most once.
   */
  std::optional<std::string> nextAfterRejection(
    const std::string & rejected, const FallbackChain & chain,
    const std::vector<std::string> & attempted) const;

  /// True when `mode` is empty, kUnknownMode, or in the excluded set.
  bool isExcluded(const std::string & mode) const;

private:
  std::vector<std::string> excludedModes_;
  std::optional<std::string> snapshot_;
};

/// Upper-cases ASCII mode names so "loiter" and "LOITER" compare equal.
std::string normalizeMode(const std::string & mode);

}  // namespace engagement_manager
