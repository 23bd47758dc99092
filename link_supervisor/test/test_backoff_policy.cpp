#include <gtest/gtest.h>

#include <link_supervisor/backoff_policy.hpp>

#include <cstdint>
#include <stdexcept>

TEST(BackoffPolicyTest, GrowsExponentiallyUpToMax)
{
  link_supervisor::BackoffPolicy policy;
  EXPECT_DOUBLE_EQ(policy.delayFor(0), 5.0);
  EXPECT_DOUBLE_EQ(policy.delayFor(1), 10.0);
  EXPECT_DOUBLE_EQ(policy.delayFor(2), 20.0);
  EXPECT_DOUBLE_EQ(policy.delayFor(3), 40.0);
  EXPECT_DOUBLE_EQ(policy.delayFor(4), 60.0);
  EXPECT_DOUBLE_EQ(policy.delayFor(1000), 60.0);
}

TEST(BackoffPolicyTest, NeverDecreases)
{
  link_supervisor::BackoffPolicy policy;
  policy.initial_s = 0.5;
  policy.multiplier = 1.7;
  policy.max_s = 45.0;
  double previous = 0.0;
  for (uint32_t n = 0; n < 64; ++n) {
    const double delay = policy.delayFor(n);
    EXPECT_GE(delay, previous) << "failures=" << n;
    EXPECT_LE(delay, policy.max_s);
    previous = delay;
  }
}

// multiplier = 1 reproduces a fixed restart delay.
TEST(BackoffPolicyTest, UnitMultiplierIsConstant)
{
  link_supervisor::BackoffPolicy policy;
  policy.multiplier = 1.0;
  EXPECT_DOUBLE_EQ(policy.delayFor(0), 5.0);
  EXPECT_DOUBLE_EQ(policy.delayFor(7), 5.0);
}

TEST(BackoffPolicyTest, RejectsInvalidPolicy)
{
  link_supervisor::BackoffPolicy shrinking;
  shrinking.multiplier = 0.5;
  EXPECT_THROW(shrinking.validate(), std::invalid_argument);

  link_supervisor::BackoffPolicy zero;
  zero.initial_s = 0.0;
  EXPECT_THROW(zero.validate(), std::invalid_argument);

  link_supervisor::BackoffPolicy inverted;
  inverted.max_s = 1.0;
  EXPECT_THROW(inverted.validate(), std::invalid_argument);

  EXPECT_NO_THROW(link_supervisor::BackoffPolicy{}.validate());
}
