#include <link_supervisor/backoff_policy.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace link_supervisor
{

void BackoffPolicy::validate() const
{
  if (!(initial_s > 0.0) || !std::isfinite(initial_s)) {
    throw std::invalid_argument("backoff.initial_s must be > 0");
  }
  if (!(multiplier >= 1.0) || !std::isfinite(multiplier)) {
    throw std::invalid_argument("backoff.multiplier must be >= 1");
  }
  if (!(max_s >= initial_s) || !std::isfinite(max_s)) {
    throw std::invalid_argument("backoff.max_s must be >= backoff.initial_s");
  }
}

double BackoffPolicy::delayFor(const uint32_t failures) const
{
  double delay = initial_s;
  for (uint32_t i = 0; i < failures && delay < max_s; ++i) {
    delay *= multiplier;
  }
  return std::min(delay, max_s);
}

}  // namespace link_supervisor
