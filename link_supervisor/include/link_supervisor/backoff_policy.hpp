#pragma once

#include <cstdint>

namespace link_supervisor
{

/**
 * Bounded exponential restart delay.
 *
 *   delay(n) = min(initial_s * multiplier^n, max_s)
 *
 * where n is the number of consecutive failures before the exit. With
 * multiplier = 1 the delay is constant. delay(n) never decreases as n grows.
 */
struct BackoffPolicy
{
  double initial_s{5.0};
  double multiplier{2.0};
  double max_s{60.0};

  /// Throws std::invalid_argument on a non-positive delay or a multiplier below 1.
  void validate() const;

  double delayFor(uint32_t failures) const;
};

}  // namespace link_supervisor
