#include "ob/timer.hh"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

TEST(Timer, StoppedTimerReadsZero)
{
  OB::Timer timer;

  EXPECT_EQ(timer.time<std::chrono::nanoseconds>().count(), 0);
}

TEST(Timer, LapReturnsElapsedAndRestarts)
{
  OB::Timer timer;
  timer.start();

  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto const first = timer.lap();

  EXPECT_GE(first, 0.02);

  timer.reset();

  EXPECT_EQ(timer.time<std::chrono::nanoseconds>().count(), 0);
}
