#include "slidr/pace.hh"

#include <gtest/gtest.h>

#include <limits>

TEST(Pace, FreshEstimator)
{
  Slidr::Pace const pace;

  EXPECT_EQ(pace.count(), 0u);
  EXPECT_FALSE(pace.should_enable_autoplay());
  EXPECT_DOUBLE_EQ(pace.predict(), 7.0);
}

TEST(Pace, FirstObservationSeedsAverage)
{
  Slidr::Pace pace;
  pace.add_observation(10.0);

  EXPECT_DOUBLE_EQ(pace.ema(), 10.0);
  EXPECT_DOUBLE_EQ(pace.predict(), 12.0);
}

TEST(Pace, ExponentialMovingAverage)
{
  Slidr::Pace pace;
  pace.add_observation(10.0);
  pace.add_observation(20.0);

  EXPECT_NEAR(pace.ema(), 13.0, 1e-9);

  pace.add_observation(15.0);

  EXPECT_NEAR(pace.ema(), 13.6, 1e-9);
  EXPECT_NEAR(pace.predict(), 15.6, 1e-9);
}

TEST(Pace, AutoplayNeedsFiveObservations)
{
  Slidr::Pace pace;

  for (int i = 0; i < 4; ++i)
  {
    pace.add_observation(8.0);
  }

  EXPECT_FALSE(pace.should_enable_autoplay());

  pace.add_observation(8.0);

  EXPECT_TRUE(pace.should_enable_autoplay());
}

TEST(Pace, ShortObservationsAreClamped)
{
  Slidr::Pace pace;
  pace.add_observation(2.0);

  EXPECT_DOUBLE_EQ(pace.ema(), 5.0);
  EXPECT_DOUBLE_EQ(pace.predict(), 7.0);

  pace.add_observation(-1.0);
  pace.add_observation(std::numeric_limits<double>::quiet_NaN());

  EXPECT_DOUBLE_EQ(pace.ema(), 5.0);
  EXPECT_EQ(pace.count(), 3u);
}

TEST(Pace, LongObservationsAreKept)
{
  Slidr::Pace pace;
  pace.add_observation(300.0);

  EXPECT_DOUBLE_EQ(pace.predict(), 302.0);
}

TEST(Pace, SlowerReaderGetsLongerPrediction)
{
  Slidr::Pace fast;
  Slidr::Pace slow;

  for (int i = 0; i < 3; ++i)
  {
    fast.add_observation(6.0);
    slow.add_observation(6.0);
  }

  for (int i = 0; i < 5; ++i)
  {
    fast.add_observation(6.0);
    slow.add_observation(15.0);
  }

  EXPECT_GT(slow.predict(), fast.predict());
}

TEST(Pace, ResetForgetsObservations)
{
  Slidr::Pace pace;

  for (int i = 0; i < 6; ++i)
  {
    pace.add_observation(9.0);
  }

  pace.reset();

  EXPECT_EQ(pace.count(), 0u);
  EXPECT_FALSE(pace.should_enable_autoplay());
  EXPECT_DOUBLE_EQ(pace.predict(), 7.0);
}
